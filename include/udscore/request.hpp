#ifndef UDSCORE_REQUEST_HPP
#define UDSCORE_REQUEST_HPP

/**
 * @file request.hpp
 * @brief Client to server request framing - ISO 14229-1:2013 Section 7.2
 *
 * Wire layout:
 *   [SID] [sub-function | 0x80 if suppressed]? [data...]
 *
 * The sub-function byte is present only for services that declare one.
 * There is no length field or padding: frame boundaries come from ISO-TP.
 */

#include "udscore/services.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace udscore {

class Request {
public:
  Request() = default;

  /**
   * @param service Service descriptor from a ServiceRegistry (may be null)
   * @param subfunction Required when the service uses a sub-function
   * @param suppress_positive_response Sets bit 7 of the sub-function byte
   * @param data Bytes appended after the header
   */
  explicit Request(const ServiceDescriptor* service,
                   std::optional<uint8_t> subfunction = std::nullopt,
                   bool suppress_positive_response = false,
                   std::vector<uint8_t> data = {});

  /**
   * @brief Serialize to a transport payload
   * @throws ConfigurationError if the service is missing, or if it uses a
   *         sub-function and none (or one above 0x7F) is set
   */
  std::vector<uint8_t> get_payload() const;

  /**
   * @brief Rebuild a request from a received payload (server side)
   *
   * Never throws. An empty payload or an unknown SID yields a request with
   * no service and nothing else parsed.
   */
  static Request from_payload(const ServiceRegistry& registry,
                              const std::vector<uint8_t>& payload);

  /// Payload length, 0 if the request cannot be serialized
  size_t size() const;

  std::string to_string() const;

  const ServiceDescriptor* service{nullptr};
  std::optional<uint8_t> subfunction;
  bool suppress_positive_response{false};
  std::vector<uint8_t> data;  ///< Empty = no data
};

} // namespace udscore

#endif // UDSCORE_REQUEST_HPP
