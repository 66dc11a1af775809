#include "udscore/request.hpp"
#include "udscore/errors.hpp"
#include <sstream>

namespace udscore {

Request::Request(const ServiceDescriptor* svc,
                 std::optional<uint8_t> sub,
                 bool suppress,
                 std::vector<uint8_t> payload_data)
    : service(svc),
      subfunction(sub),
      suppress_positive_response(suppress),
      data(std::move(payload_data)) {
  // A sub-function given for a service that has none is meaningless
  if (service && !service->uses_subfunction) {
    subfunction.reset();
  }
}

std::vector<uint8_t> Request::get_payload() const {
  if (!service) {
    throw ConfigurationError("Cannot generate a payload. Request has no service");
  }

  if (service->uses_subfunction) {
    if (!subfunction) {
      throw ConfigurationError("Cannot generate a payload. Service " + service->name +
                               " requires a sub-function");
    }
    if (*subfunction & kSuppressPositiveResponseBit) {
      throw ConfigurationError("Cannot generate a payload. Sub-function must fit in 7 bits, "
                               "bit 7 is the suppress positive response flag");
    }
  }

  std::vector<uint8_t> payload;
  payload.reserve(2 + data.size());
  payload.push_back(service->request_id);

  if (service->uses_subfunction) {
    uint8_t sf = *subfunction;
    if (suppress_positive_response) {
      sf |= kSuppressPositiveResponseBit;
    }
    payload.push_back(sf);
  }

  payload.insert(payload.end(), data.begin(), data.end());
  return payload;
}

Request Request::from_payload(const ServiceRegistry& registry,
                              const std::vector<uint8_t>& payload) {
  Request req;
  if (payload.empty()) return req;

  req.service = registry.by_request_id(payload[0]);
  if (!req.service) return req;  // unknown SID, nothing else to parse

  size_t data_start = 1;
  if (req.service->uses_subfunction) {
    if (payload.size() >= 2) {
      req.subfunction = static_cast<uint8_t>(payload[1] & 0x7F);
      req.suppress_positive_response = (payload[1] & kSuppressPositiveResponseBit) != 0;
    }
    data_start = 2;
  }

  if (payload.size() > data_start) {
    req.data.assign(payload.begin() + data_start, payload.end());
  }
  return req;
}

size_t Request::size() const {
  try {
    return get_payload().size();
  } catch (const ConfigurationError&) {
    return 0;
  }
}

std::string Request::to_string() const {
  std::ostringstream oss;
  oss << "<Request: [" << (service ? service->name : "None") << "] ";
  if (service && service->uses_subfunction && subfunction) {
    oss << "(subfunction=" << static_cast<int>(*subfunction) << ") ";
  }
  oss << "- " << data.size() << " data bytes";
  if (suppress_positive_response) {
    oss << " [SuppressPosResponse]";
  }
  oss << ">";
  return oss.str();
}

} // namespace udscore
