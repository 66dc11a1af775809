#include "udscore/socketcan_isotp.hpp"
#include "udscore/errors.hpp"
#include <linux/can.h>
#include <linux/can/isotp.h>
#include <net/if.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace udscore {

static std::string errno_message(const std::string& what) {
  return what + ": " + strerror(errno);
}

SocketCanIsoTp::~SocketCanIsoTp() {
  close();
}

void SocketCanIsoTp::bind(const std::string& interface, uint32_t rxid, uint32_t txid) {
  if (bound()) {
    throw TransportError("ISO-TP socket is already bound");
  }

  unsigned int ifindex = if_nametoindex(interface.c_str());
  if (ifindex == 0) {
    throw TransportError(errno_message("Unknown CAN interface '" + interface + "'"));
  }

  int fd = ::socket(PF_CAN, SOCK_DGRAM, CAN_ISOTP);
  if (fd < 0) {
    throw TransportError(errno_message("Failed to create ISO-TP socket"));
  }

  if (tx_padding_) {
    struct can_isotp_options opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.flags = CAN_ISOTP_TX_PADDING;
    opts.txpad_content = *tx_padding_;
    if (setsockopt(fd, SOL_CAN_ISOTP, CAN_ISOTP_OPTS, &opts, sizeof(opts)) < 0) {
      std::string msg = errno_message("Failed to set ISO-TP options");
      ::close(fd);
      throw TransportError(msg);
    }
  }

  struct sockaddr_can addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.can_family = AF_CAN;
  addr.can_ifindex = static_cast<int>(ifindex);
  addr.can_addr.tp.rx_id = rxid;
  addr.can_addr.tp.tx_id = txid;

  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::string msg = errno_message("Failed to bind ISO-TP socket on " + interface);
    ::close(fd);
    throw TransportError(msg);
  }

  fd_ = fd;
}

void SocketCanIsoTp::send(const std::vector<uint8_t>& payload) {
  int fd = fd_;
  if (fd < 0) {
    throw TransportError("ISO-TP socket is not bound");
  }
  if (payload.empty() || payload.size() > kMaxPayload) {
    throw TransportError("ISO-TP payload length " + std::to_string(payload.size()) +
                         " out of range (1-" + std::to_string(kMaxPayload) + ")");
  }

  ssize_t n = ::write(fd, payload.data(), payload.size());
  if (n < 0) {
    throw TransportError(errno_message("ISO-TP write failed"));
  }
  if (static_cast<size_t>(n) != payload.size()) {
    throw TransportError("ISO-TP write truncated");
  }
}

std::optional<std::vector<uint8_t>> SocketCanIsoTp::recv(std::chrono::milliseconds timeout) {
  int fd = fd_;
  if (fd < 0) {
    throw TransportError("ISO-TP socket is not bound");
  }

  fd_set rfds;
  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  FD_ZERO(&rfds);
  FD_SET(fd, &rfds);

  int ret = select(fd + 1, &rfds, nullptr, nullptr, &tv);
  if (ret == 0) return std::nullopt;
  if (ret < 0) {
    if (errno == EINTR) return std::nullopt;
    throw TransportError(errno_message("ISO-TP select failed"));
  }

  std::vector<uint8_t> buf(kMaxPayload);
  ssize_t n = ::read(fd, buf.data(), buf.size());
  if (n < 0) {
    // Flow control timeouts and similar protocol errors surface here
    throw TransportError(errno_message("ISO-TP read failed"));
  }
  buf.resize(static_cast<size_t>(n));
  return buf;
}

void SocketCanIsoTp::close() {
  int fd = fd_.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
}

} // namespace udscore
