#ifndef UDSCORE_SOCKETCAN_ISOTP_HPP
#define UDSCORE_SOCKETCAN_ISOTP_HPP

/**
 * @file socketcan_isotp.hpp
 * @brief Linux SocketCAN ISO-TP socket (PF_CAN / CAN_ISOTP)
 *
 * The kernel ISO-TP module (can-isotp, mainline since 5.10) performs
 * segmentation, flow control and reassembly. Each read() returns one
 * complete payload; each write() sends one.
 */

#include "udscore/transport.hpp"
#include <atomic>
#include <optional>

namespace udscore {

class SocketCanIsoTp : public IsoTpSocket {
public:
  /// Largest payload a classic ISO-TP message can carry (12-bit length)
  static constexpr size_t kMaxPayload = 4095;

  /**
   * @param tx_padding Pad transmitted CAN frames to 8 bytes with this value
   */
  explicit SocketCanIsoTp(std::optional<uint8_t> tx_padding = std::nullopt)
      : tx_padding_(tx_padding) {}

  ~SocketCanIsoTp() override;

  SocketCanIsoTp(const SocketCanIsoTp&) = delete;
  SocketCanIsoTp& operator=(const SocketCanIsoTp&) = delete;

  void bind(const std::string& interface, uint32_t rxid, uint32_t txid) override;
  void send(const std::vector<uint8_t>& payload) override;
  std::optional<std::vector<uint8_t>> recv(std::chrono::milliseconds timeout) override;
  void close() override;
  bool bound() const override { return fd_ >= 0; }

private:
  std::optional<uint8_t> tx_padding_;
  std::atomic<int> fd_{-1};
};

} // namespace udscore

#endif // UDSCORE_SOCKETCAN_ISOTP_HPP
