#ifndef UDSCORE_TRANSPORT_HPP
#define UDSCORE_TRANSPORT_HPP

/**
 * @file transport.hpp
 * @brief ISO-TP (ISO 15765-2) socket abstraction
 *
 * The socket delivers and accepts complete, reassembled UDS payloads;
 * segmentation and flow control happen below this interface.
 *
 * The Connection reads from one thread and writes from another, but never
 * calls recv() concurrently with itself nor send() concurrently with itself.
 * Implementations need no locking beyond that.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace udscore {

class IsoTpSocket {
public:
  virtual ~IsoTpSocket() = default;

  /// @throws TransportError if the socket cannot be bound
  virtual void bind(const std::string& interface, uint32_t rxid, uint32_t txid) = 0;

  /// @throws TransportError on failure
  virtual void send(const std::vector<uint8_t>& payload) = 0;

  /**
   * @brief Wait up to timeout for one complete payload
   * @return nullopt on timeout
   * @throws TransportError on any other failure
   */
  virtual std::optional<std::vector<uint8_t>> recv(std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;

  virtual bool bound() const = 0;
};

} // namespace udscore

#endif // UDSCORE_TRANSPORT_HPP
