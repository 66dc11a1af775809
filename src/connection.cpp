#include "udscore/connection.hpp"
#include "udscore/errors.hpp"
#include "udscore/request.hpp"
#include "udscore/response.hpp"
#include <iostream>
#include <system_error>

namespace udscore {

static void default_error_callback(const std::string& message) {
  std::cerr << "[udscore] " << message << "\n";
}

// Connection whose receiver runs on the current thread, if any
static thread_local const Connection* tls_receiver_of = nullptr;

Connection::Connection(std::unique_ptr<IsoTpSocket> socket, ConnectionConfig config)
    : socket_(std::move(socket)),
      config_(std::move(config)),
      rxqueue_(config_.queue_capacity),
      error_cb_(default_error_callback) {
  if (!socket_) {
    throw ConfigurationError("Connection requires an ISO-TP socket");
  }
}

Connection::~Connection() {
  close();
}

Connection& Connection::open() {
  if (is_open()) return *this;

  // Release a previous session whose receiver stopped on a transport error
  close();

  socket_->bind(config_.interface, config_.rxid, config_.txid);
  rxqueue_.clear();
  exit_requested_ = false;

  try {
    rxthread_ = std::thread(&Connection::rx_task, this);
  } catch (const std::system_error&) {
    socket_->close();
    throw;
  }

  opened_ = true;
  return *this;
}

void Connection::close() {
  exit_requested_ = true;
  // From the error callback the receiver cannot join itself; it exits on
  // return and the next open(), close() or the destructor joins it
  if (rxthread_.joinable() && tls_receiver_of != this) {
    rxthread_.join();
  }
  if (opened_) {
    socket_->close();
  }
  opened_ = false;
}

bool Connection::is_open() const {
  return socket_->bound() && !exit_requested_;
}

void Connection::rx_task() {
  tls_receiver_of = this;
  while (!exit_requested_) {
    try {
      auto frame = socket_->recv(config_.recv_timeout);
      if (!frame) continue;  // timeout, poll exit_requested_ again

      if (!rxqueue_.try_push(std::move(*frame))) {
        report_error("Receive queue full (" + std::to_string(rxqueue_.capacity()) +
                     " frames), frame dropped");
      }
    } catch (const std::exception& e) {
      // Not restarted: the caller sees is_open() == false and reopens
      report_error(std::string("Receiver stopped: ") + e.what());
      exit_requested_ = true;
    }
  }
}

void Connection::send(const Request& request) {
  send(request.get_payload());
}

void Connection::send(const Response& response) {
  send(response.get_payload());
}

void Connection::send(const std::vector<uint8_t>& payload) {
  if (!opened_) {
    throw ConnectionError("Connection is not opened");
  }
  socket_->send(payload);
}

std::optional<std::vector<uint8_t>> Connection::wait_frame(std::chrono::milliseconds timeout,
                                                           bool raise_on_timeout) {
  if (!opened_) {
    if (raise_on_timeout) {
      throw ConnectionError("Connection is not opened");
    }
    return std::nullopt;
  }

  auto frame = rxqueue_.pop(timeout);
  if (!frame && raise_on_timeout) {
    throw TimeoutError("Did not receive ISO-TP frame in time (timeout=" +
                       std::to_string(timeout.count()) + " ms)");
  }
  return frame;
}

size_t Connection::empty_rxqueue() {
  return rxqueue_.clear();
}

void Connection::set_error_callback(ErrorCallback callback) {
  error_cb_ = callback ? std::move(callback) : ErrorCallback(default_error_callback);
}

void Connection::report_error(const std::string& message) {
  error_cb_(message);
}

} // namespace udscore
