#include "udscore/response.hpp"
#include "udscore/errors.hpp"
#include <sstream>

namespace udscore {

static void set_code(Response& r, uint8_t code) {
  r.code = code;
  r.code_name = nrc::get_name(code);
}

Response::Response(const ServiceDescriptor* svc, std::optional<uint8_t> c,
                   std::vector<uint8_t> payload_data)
    : service(svc) {
  if (!payload_data.empty() && service && !service->has_response_data) {
    throw ConfigurationError("Service " + service->name +
                             " should not have any data in its response");
  }
  data = std::move(payload_data);

  if (c) {
    set_code(*this, *c);
    positive = !nrc::is_negative(*c);
  }

  if (service && code) {
    valid = true;
    invalid_reason.clear();
  }
}

std::vector<uint8_t> Response::get_payload() const {
  if (!service) {
    throw ConfigurationError("Cannot make payload from response object. No service set");
  }
  if (!code) {
    throw ConfigurationError("Cannot make payload from response object. No response code set");
  }

  std::vector<uint8_t> payload;
  payload.push_back(service->response_id);
  if (!positive) {
    // [responseID][0x7F][NRC]; negative responses never carry data
    payload.push_back(kNegativeResponseMarker);
    payload.push_back(*code);
    return payload;
  }

  if (service->has_response_data) {
    payload.insert(payload.end(), data.begin(), data.end());
  }
  return payload;
}

Response Response::from_payload(const ServiceRegistry& registry,
                                const std::vector<uint8_t>& payload) {
  Response response;

  if (payload.empty()) {
    response.invalid_reason = "Payload is empty: unknown service";
    return response;
  }

  // ISO 14229 form [0x7F][requestID][NRC]. No response ID can be 0x7F, so
  // this never shadows a registered service.
  if (payload[0] == kNegativeResponseMarker) {
    response.positive = false;
    if (payload.size() < 2) {
      response.invalid_reason = "Incomplete negative response (7Fxx): missing service ID";
      return response;
    }

    response.service = registry.by_request_id(payload[1]);
    if (!response.service) {
      response.invalid_reason = "Negative response names an unknown service";
      return response;
    }

    if (payload.size() < 3) {
      response.invalid_reason = "Incomplete negative response (7Fxx): missing response code";
      return response;
    }

    set_code(response, payload[2]);
    if (payload.size() > 3) {
      response.data.assign(payload.begin() + 3, payload.end());
    }
    response.valid = true;
    response.invalid_reason.clear();
    return response;
  }

  response.service = registry.by_response_id(payload[0]);
  if (!response.service) {
    response.invalid_reason = "Payload first byte is not a known service response ID: unknown service";
    return response;
  }

  if (payload.size() == 1) {
    if (response.service->has_response_data) {
      response.invalid_reason = "Payload too short: service " + response.service->name +
                                " expects response data";
      return response;
    }
    response.positive = true;
    set_code(response, static_cast<uint8_t>(nrc::Code::PositiveResponse));
    response.valid = true;
    response.invalid_reason.clear();
    return response;
  }

  size_t data_start = 1;
  if (payload[1] == kNegativeResponseMarker) {
    // [responseID][0x7F][NRC]
    response.positive = false;
    if (payload.size() < 3) {
      response.invalid_reason = "Incomplete negative response (7Fxx): missing response code";
      return response;
    }
    set_code(response, payload[2]);
    data_start = 3;  // trailing bytes are not allowed by ISO 14229 but are kept
  } else {
    response.positive = true;
    set_code(response, static_cast<uint8_t>(nrc::Code::PositiveResponse));
  }

  if (payload.size() > data_start) {
    response.data.assign(payload.begin() + data_start, payload.end());
  }
  response.valid = true;
  response.invalid_reason.clear();
  return response;
}

size_t Response::size() const {
  try {
    return get_payload().size();
  } catch (const ConfigurationError&) {
    return 0;
  }
}

std::string Response::to_string() const {
  std::ostringstream oss;
  oss << "<";
  if (!valid) {
    oss << "InvalidResponse(" << invalid_reason << ")";
  } else if (positive) {
    oss << nrc::get_name(nrc::Code::PositiveResponse);
  } else {
    oss << "NegativeResponse(" << code_name << ")";
  }
  oss << ": [" << (service ? service->name : "None") << "] - "
      << data.size() << " data bytes>";
  return oss.str();
}

} // namespace udscore
