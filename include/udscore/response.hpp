#ifndef UDSCORE_RESPONSE_HPP
#define UDSCORE_RESPONSE_HPP

/**
 * @file response.hpp
 * @brief Server to client response framing - ISO 14229-1:2013 Section 8.3-8.4
 *
 * Wire layout:
 *   Positive: [SID+0x40] [data...]    data only if the service declares it
 *   Negative: [SID+0x40] [0x7F] [NRC]
 *
 * The parser also accepts the ISO 14229 negative form [0x7F] [SID] [NRC].
 * Either way a positive response cannot start its data with 0x7F.
 *
 * Parsing never throws. A malformed frame produces a Response with
 * valid == false and invalid_reason set; check valid before trusting
 * any other field.
 */

#include "udscore/services.hpp"
#include "udscore/nrc.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace udscore {

class Response {
public:
  Response() = default;

  /**
   * @brief Build a response to emit (server side)
   *
   * positive is derived from the code: anything nrc::is_negative() rejects
   * counts as positive.
   *
   * @throws ConfigurationError if data is given for a service that declares
   *         no response data
   */
  Response(const ServiceDescriptor* service, std::optional<uint8_t> code,
           std::vector<uint8_t> data = {});

  Response(const ServiceDescriptor* service, nrc::Code code,
           std::vector<uint8_t> data = {})
      : Response(service, static_cast<uint8_t>(code), std::move(data)) {}

  /**
   * @brief Serialize to a transport payload
   * @throws ConfigurationError without a service or a code
   */
  std::vector<uint8_t> get_payload() const;

  /// Parse a received transport payload (client side)
  static Response from_payload(const ServiceRegistry& registry,
                               const std::vector<uint8_t>& payload);

  /// Payload length, 0 if the response cannot be serialized
  size_t size() const;

  std::string to_string() const;

  bool is_response_pending() const {
    return valid && !positive && code && nrc::is_response_pending(*code);
  }

  const ServiceDescriptor* service{nullptr};
  bool positive{false};
  std::optional<uint8_t> code;
  std::string code_name;
  std::vector<uint8_t> data;  ///< Empty = no data
  bool valid{false};
  std::string invalid_reason{"Object not initialized"};
};

} // namespace udscore

#endif // UDSCORE_RESPONSE_HPP
