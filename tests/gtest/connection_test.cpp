/**
 * @file connection_test.cpp
 * @brief Tests for the connection and its receiver thread (connection.cpp)
 */

#include <gtest/gtest.h>
#include "udscore/connection.hpp"
#include "udscore/errors.hpp"
#include "udscore/request.hpp"
#include "udscore/response.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>

using namespace udscore;
using namespace std::chrono_literals;

// Mock ISO-TP socket: frames injected by the test come out of recv()
class MockIsoTpSocket : public IsoTpSocket {
public:
  void bind(const std::string& interface, uint32_t rxid, uint32_t txid) override {
    if (fail_bind_) throw TransportError("No such device");
    interface_ = interface;
    rxid_ = rxid;
    txid_ = txid;
    bound_ = true;
    ++bind_count_;
  }

  void send(const std::vector<uint8_t>& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(payload);
  }

  std::optional<std::vector<uint8_t>> recv(std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !incoming_.empty() || fail_recv_; })) {
      return std::nullopt;
    }
    if (fail_recv_) {
      fail_recv_ = false;
      throw TransportError("Bus off");
    }
    auto frame = incoming_.front();
    incoming_.pop_front();
    return frame;
  }

  void close() override {
    bound_ = false;
    ++close_count_;
  }

  bool bound() const override { return bound_; }

  void inject(const std::vector<uint8_t>& frame) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      incoming_.push_back(frame);
    }
    cv_.notify_all();
  }

  void inject_error() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fail_recv_ = true;
    }
    cv_.notify_all();
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incoming_.size();
  }

  std::vector<std::vector<uint8_t>> sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

  void set_fail_bind(bool f) { fail_bind_ = f; }

  std::string interface_;
  uint32_t rxid_ = 0;
  uint32_t txid_ = 0;
  int bind_count_ = 0;
  int close_count_ = 0;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::vector<uint8_t>> incoming_;
  std::vector<std::vector<uint8_t>> sent_;
  std::atomic<bool> bound_{false};
  bool fail_recv_ = false;
  bool fail_bind_ = false;
};

// Poll until pred() holds or the deadline passes
template <typename Pred>
static bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

class ConnectionTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto socket = std::make_unique<MockIsoTpSocket>();
    socket_ = socket.get();

    ConnectionConfig cfg;
    cfg.interface = "vcan0";
    cfg.rxid = 0x7E8;
    cfg.txid = 0x7E0;
    cfg.recv_timeout = 10ms;
    cfg.queue_capacity = 4;
    conn_ = std::make_unique<Connection>(std::move(socket), cfg);

    conn_->set_error_callback([this](const std::string& msg) {
      std::lock_guard<std::mutex> lock(errors_mutex_);
      errors_.push_back(msg);
    });
  }

  void TearDown() override { conn_.reset(); }

  std::vector<std::string> errors() {
    std::lock_guard<std::mutex> lock(errors_mutex_);
    return errors_;
  }

  MockIsoTpSocket* socket_ = nullptr;  // owned by conn_
  std::unique_ptr<Connection> conn_;
  ServiceRegistry reg_ = ServiceRegistry::standard();

  std::mutex errors_mutex_;
  std::vector<std::string> errors_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ConnectionTest, NullSocketRejected) {
  EXPECT_THROW(Connection(nullptr), ConfigurationError);
}

TEST_F(ConnectionTest, OpenBindsWithConfiguredAddresses) {
  EXPECT_FALSE(conn_->is_open());
  conn_->open();
  EXPECT_TRUE(conn_->is_open());
  EXPECT_EQ(socket_->interface_, "vcan0");
  EXPECT_EQ(socket_->rxid_, 0x7E8u);
  EXPECT_EQ(socket_->txid_, 0x7E0u);
}

TEST_F(ConnectionTest, OpenTwiceIsNoop) {
  conn_->open();
  conn_->open();
  EXPECT_EQ(socket_->bind_count_, 1);
}

TEST_F(ConnectionTest, BindFailurePropagates) {
  socket_->set_fail_bind(true);
  EXPECT_THROW(conn_->open(), TransportError);
  EXPECT_FALSE(conn_->is_open());
}

TEST_F(ConnectionTest, CloseIsIdempotent) {
  conn_->close();  // never opened
  EXPECT_EQ(socket_->close_count_, 0);

  conn_->open();
  conn_->close();
  conn_->close();
  EXPECT_FALSE(conn_->is_open());
  EXPECT_EQ(socket_->close_count_, 1);
}

TEST_F(ConnectionTest, CloseReturnsPromptly) {
  conn_->open();
  auto start = std::chrono::steady_clock::now();
  conn_->close();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}

TEST_F(ConnectionTest, ReopenAfterClose) {
  conn_->open();
  conn_->close();
  conn_->open();
  EXPECT_TRUE(conn_->is_open());
  EXPECT_EQ(socket_->bind_count_, 2);

  socket_->inject({0x50, 0x01});
  auto frame = conn_->wait_frame(1000ms);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(*frame, (std::vector<uint8_t>{0x50, 0x01}));
}

TEST_F(ConnectionTest, GuardClosesOnScopeExit) {
  {
    ConnectionGuard guard(*conn_);
    EXPECT_TRUE(conn_->is_open());
  }
  EXPECT_FALSE(conn_->is_open());
  EXPECT_EQ(socket_->close_count_, 1);
}

TEST_F(ConnectionTest, GuardClosesWhenExceptionEscapes) {
  try {
    ConnectionGuard guard(*conn_);
    conn_->wait_frame(10ms, true);
  } catch (const TimeoutError&) {
  }
  EXPECT_FALSE(conn_->is_open());
}

// ============================================================================
// Receiving
// ============================================================================

TEST_F(ConnectionTest, WaitFrameWhenNotOpen) {
  EXPECT_FALSE(conn_->wait_frame(10ms).has_value());
  EXPECT_THROW(conn_->wait_frame(10ms, true), ConnectionError);
}

TEST_F(ConnectionTest, WaitFrameTimesOut) {
  conn_->open();
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(conn_->wait_frame(50ms).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST_F(ConnectionTest, WaitFrameRaisesOnTimeout) {
  conn_->open();
  EXPECT_THROW(conn_->wait_frame(50ms, true), TimeoutError);
}

TEST_F(ConnectionTest, FramesDeliveredInArrivalOrder) {
  conn_->open();
  socket_->inject({0x62, 0x01});
  socket_->inject({0x62, 0x02});
  socket_->inject({0x62, 0x03});

  for (uint8_t i = 1; i <= 3; ++i) {
    auto frame = conn_->wait_frame(1000ms);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ((*frame)[1], i);
  }
}

TEST_F(ConnectionTest, ReceivedFrameParsesAsResponse) {
  conn_->open();
  socket_->inject({0x62, 0x7F, 0x31});
  auto frame = conn_->wait_frame(1000ms, true);
  ASSERT_TRUE(frame.has_value());

  auto response = Response::from_payload(reg_, *frame);
  EXPECT_TRUE(response.valid);
  EXPECT_FALSE(response.positive);
  EXPECT_EQ(response.code, 0x31);
}

TEST_F(ConnectionTest, EmptyRxQueueDiscardsStaleFrames) {
  conn_->open();
  socket_->inject({0x7E, 0x00});
  socket_->inject({0x7E, 0x00});
  ASSERT_TRUE(wait_until([this] { return socket_->pending() == 0; }));

  size_t dropped = 0;
  ASSERT_TRUE(wait_until([&] {
    dropped += conn_->empty_rxqueue();
    return dropped == 2;
  }));
  EXPECT_FALSE(conn_->wait_frame(20ms).has_value());
}

TEST_F(ConnectionTest, FullQueueDropsNewestAndReports) {
  conn_->open();
  for (uint8_t i = 0; i < 5; ++i) {
    socket_->inject({0x62, i});
  }
  ASSERT_TRUE(wait_until([this] { return !errors().empty(); }));
  EXPECT_NE(errors().front().find("queue full"), std::string::npos);

  for (uint8_t i = 0; i < 4; ++i) {
    auto frame = conn_->wait_frame(1000ms);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ((*frame)[1], i);
  }
  EXPECT_FALSE(conn_->wait_frame(20ms).has_value());
}

TEST_F(ConnectionTest, TransportErrorStopsReceiver) {
  conn_->open();
  socket_->inject_error();

  ASSERT_TRUE(wait_until([this] { return !conn_->is_open(); }));
  auto errs = errors();
  ASSERT_EQ(errs.size(), 1u);
  EXPECT_NE(errs[0].find("Bus off"), std::string::npos);

  // Blocked callers are not woken, they simply time out
  EXPECT_FALSE(conn_->wait_frame(20ms).has_value());

  conn_->open();
  EXPECT_TRUE(conn_->is_open());
  socket_->inject({0x50, 0x03});
  EXPECT_TRUE(conn_->wait_frame(1000ms).has_value());
}

TEST_F(ConnectionTest, ErrorCallbackMayCloseConnection) {
  std::atomic<bool> closed_from_callback{false};
  conn_->set_error_callback([this, &closed_from_callback](const std::string&) {
    conn_->close();
    closed_from_callback = true;
  });
  conn_->open();
  socket_->inject_error();

  ASSERT_TRUE(wait_until([&] { return closed_from_callback.load(); }));
  EXPECT_FALSE(conn_->is_open());
  EXPECT_EQ(socket_->close_count_, 1);

  // Reopen joins the finished receiver
  conn_->open();
  EXPECT_TRUE(conn_->is_open());
  conn_->close();
}

TEST_F(ConnectionTest, WaitFrameWithoutLimit) {
  conn_->open();
  std::thread ecu([this] {
    std::this_thread::sleep_for(20ms);
    socket_->inject({0x7E, 0x00});
  });
  auto frame = conn_->wait_frame(std::chrono::milliseconds::max());
  ecu.join();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(*frame, (std::vector<uint8_t>{0x7E, 0x00}));
}

// ============================================================================
// Sending
// ============================================================================

TEST_F(ConnectionTest, SendWhenNotOpen) {
  EXPECT_THROW(conn_->send(std::vector<uint8_t>{0x3E, 0x00}), ConnectionError);
}

TEST_F(ConnectionTest, SendRequest) {
  conn_->open();
  conn_->send(Request(reg_.find(SID::ReadDataByIdentifier), std::nullopt, false, {0xF1, 0x90}));

  auto sent = socket_->sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0], (std::vector<uint8_t>{0x22, 0xF1, 0x90}));
}

TEST_F(ConnectionTest, SendResponseAndRawPayload) {
  conn_->open();
  conn_->send(Response(reg_.find(SID::TesterPresent), nrc::Code::PositiveResponse, {0x00}));
  conn_->send(std::vector<uint8_t>{0x3E, 0x80});

  auto sent = socket_->sent();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0], (std::vector<uint8_t>{0x7E, 0x00}));
  EXPECT_EQ(sent[1], (std::vector<uint8_t>{0x3E, 0x80}));
}

TEST_F(ConnectionTest, SendUnserializableRequest) {
  conn_->open();
  EXPECT_THROW(conn_->send(Request(reg_.find(SID::ECUReset))), ConfigurationError);
  EXPECT_TRUE(socket_->sent().empty());
}
