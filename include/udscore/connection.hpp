#ifndef UDSCORE_CONNECTION_HPP
#define UDSCORE_CONNECTION_HPP

/**
 * @file connection.hpp
 * @brief Transport connection with a background receiver
 *
 * The Connection owns an IsoTpSocket. Once opened, a receiver thread pulls
 * complete payloads from the socket into a bounded FIFO; the protocol caller
 * sends requests and blocks on wait_frame() for the next payload.
 *
 * Threads:
 * - receiver: sole reader of the socket, sole producer of the FIFO
 * - caller:   sole writer of the socket, sole consumer of the FIFO
 *
 * close() asks the receiver to stop and waits for its current recv() to
 * return, so shutdown takes at most ConnectionConfig::recv_timeout.
 *
 * Usage:
 * @code
 *   udscore::ConnectionConfig cfg;
 *   cfg.interface = "can0";
 *   cfg.rxid = 0x7E8;
 *   cfg.txid = 0x7E0;
 *
 *   udscore::Connection conn(std::make_unique<udscore::SocketCanIsoTp>(), cfg);
 *   udscore::ConnectionGuard guard(conn);   // open() now, close() on scope exit
 *
 *   conn.empty_rxqueue();
 *   conn.send(request);
 *   auto frame = conn.wait_frame(std::chrono::milliseconds(1000));
 *   if (frame) {
 *     auto response = udscore::Response::from_payload(registry, *frame);
 *   }
 * @endcode
 */

#include "udscore/frame_queue.hpp"
#include "udscore/transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace udscore {

class Request;
class Response;

struct ConnectionConfig {
  std::string interface{"can0"};
  uint32_t rxid{0x7E8};  ///< ECU -> tester
  uint32_t txid{0x7E0};  ///< Tester -> ECU

  /// Receiver poll bound; also the worst-case close() latency
  std::chrono::milliseconds recv_timeout{std::chrono::milliseconds(100)};

  /// Frames held before the receiver starts dropping new ones
  size_t queue_capacity{64};
};

using ErrorCallback = std::function<void(const std::string&)>;

class Connection {
public:
  explicit Connection(std::unique_ptr<IsoTpSocket> socket, ConnectionConfig config = {});

  /// Closes the connection if still open
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /**
   * @brief Bind the socket and start the receiver
   *
   * No-op if already open. A closed connection can be opened again.
   * @throws TransportError if the socket cannot be bound
   */
  Connection& open();

  /// Stop the receiver and release the socket. Safe to call repeatedly,
  /// including from the error callback.
  void close();

  /// Socket bound and receiver still running
  bool is_open() const;

  /// @throws ConfigurationError if the request cannot be serialized
  void send(const Request& request);

  /// @throws ConfigurationError if the response cannot be serialized
  void send(const Response& response);

  /// @throws ConnectionError if not open, TransportError from the socket
  void send(const std::vector<uint8_t>& payload);

  /**
   * @brief Next received payload, in arrival order
   *
   * @param timeout How long to wait for a payload; milliseconds::max() or
   *                anything beyond BoundedQueue::kMaxWait waits without limit
   * @param raise_on_timeout Throw instead of returning nullopt
   * @throws ConnectionError if not open and raise_on_timeout
   * @throws TimeoutError if nothing arrived and raise_on_timeout
   */
  std::optional<std::vector<uint8_t>> wait_frame(
      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000),
      bool raise_on_timeout = false);

  /// Discard queued payloads without blocking, returns how many were dropped
  size_t empty_rxqueue();

  /**
   * @brief Where receiver-side problems are reported
   *
   * Called from the receiver thread. Set it before open(). The default
   * writes to std::cerr.
   */
  void set_error_callback(ErrorCallback callback);

  const ConnectionConfig& config() const { return config_; }

private:
  void rx_task();
  void report_error(const std::string& message);

  std::unique_ptr<IsoTpSocket> socket_;
  ConnectionConfig config_;
  BoundedQueue<std::vector<uint8_t>> rxqueue_;
  std::thread rxthread_;
  std::atomic<bool> exit_requested_{false};
  std::atomic<bool> opened_{false};
  ErrorCallback error_cb_;
};

/**
 * @brief RAII guard: opens the connection, closes it on every exit path
 */
class ConnectionGuard {
public:
  explicit ConnectionGuard(Connection& connection) : connection_(connection) {
    connection_.open();
  }

  ~ConnectionGuard() { connection_.close(); }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&&) = delete;
  ConnectionGuard& operator=(ConnectionGuard&&) = delete;

private:
  Connection& connection_;
};

} // namespace udscore

#endif // UDSCORE_CONNECTION_HPP
