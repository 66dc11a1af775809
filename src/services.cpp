#include "udscore/services.hpp"
#include "udscore/errors.hpp"
#include <sstream>
#include <iomanip>

namespace udscore {

static std::string hex_byte(uint8_t v) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
      << static_cast<int>(v);
  return oss.str();
}

const ServiceDescriptor& ServiceRegistry::add(const ServiceDescriptor& descriptor) {
  if (descriptor.response_id == kNegativeResponseMarker) {
    throw ConfigurationError("Service " + descriptor.name + ": response ID " +
                             hex_byte(descriptor.response_id) +
                             " collides with the negative response marker");
  }
  if (by_request_.count(descriptor.request_id)) {
    throw ConfigurationError("Service " + descriptor.name + ": request ID " +
                             hex_byte(descriptor.request_id) + " already registered");
  }
  if (response_to_request_.count(descriptor.response_id)) {
    throw ConfigurationError("Service " + descriptor.name + ": response ID " +
                             hex_byte(descriptor.response_id) + " already registered");
  }

  auto it = by_request_.emplace(descriptor.request_id, descriptor).first;
  response_to_request_.emplace(descriptor.response_id, descriptor.request_id);
  return it->second;
}

const ServiceDescriptor& ServiceRegistry::add(SID sid, const std::string& name,
                                              bool uses_subfunction,
                                              bool has_response_data) {
  ServiceDescriptor d;
  d.request_id = static_cast<uint8_t>(sid);
  d.response_id = static_cast<uint8_t>(d.request_id + kPositiveResponseOffset);
  d.uses_subfunction = uses_subfunction;
  d.has_response_data = has_response_data;
  d.name = name;
  return add(d);
}

const ServiceDescriptor* ServiceRegistry::by_request_id(uint8_t request_id) const {
  auto it = by_request_.find(request_id);
  return it != by_request_.end() ? &it->second : nullptr;
}

const ServiceDescriptor* ServiceRegistry::by_response_id(uint8_t response_id) const {
  auto it = response_to_request_.find(response_id);
  if (it == response_to_request_.end()) return nullptr;
  return by_request_id(it->second);
}

ServiceRegistry ServiceRegistry::standard() {
  ServiceRegistry r;
  //     SID                                    name                              subfn  data
  r.add(SID::DiagnosticSessionControl,        "DiagnosticSessionControl",        true,  true);
  r.add(SID::ECUReset,                        "ECUReset",                        true,  true);
  r.add(SID::ClearDiagnosticInformation,      "ClearDiagnosticInformation",      false, false);
  r.add(SID::ReadDTCInformation,              "ReadDTCInformation",              true,  true);
  r.add(SID::ReadDataByIdentifier,            "ReadDataByIdentifier",            false, true);
  r.add(SID::ReadMemoryByAddress,             "ReadMemoryByAddress",             false, true);
  r.add(SID::ReadScalingDataByIdentifier,     "ReadScalingDataByIdentifier",     false, true);
  r.add(SID::SecurityAccess,                  "SecurityAccess",                  true,  true);
  r.add(SID::CommunicationControl,            "CommunicationControl",            true,  true);
  r.add(SID::Authentication,                  "Authentication",                  true,  true);
  r.add(SID::ReadDataByPeriodicIdentifier,    "ReadDataByPeriodicIdentifier",    false, true);
  r.add(SID::DynamicallyDefineDataIdentifier, "DynamicallyDefineDataIdentifier", true,  true);
  r.add(SID::WriteDataByIdentifier,           "WriteDataByIdentifier",           false, true);
  r.add(SID::InputOutputControlByIdentifier,  "InputOutputControlByIdentifier",  false, true);
  r.add(SID::RoutineControl,                  "RoutineControl",                  true,  true);
  r.add(SID::RequestDownload,                 "RequestDownload",                 false, true);
  r.add(SID::RequestUpload,                   "RequestUpload",                   false, true);
  r.add(SID::TransferData,                    "TransferData",                    false, true);
  r.add(SID::RequestTransferExit,             "RequestTransferExit",             false, true);
  r.add(SID::RequestFileTransfer,             "RequestFileTransfer",             false, true);
  r.add(SID::WriteMemoryByAddress,            "WriteMemoryByAddress",            false, true);
  r.add(SID::TesterPresent,                   "TesterPresent",                   true,  true);
  r.add(SID::AccessTimingParameter,           "AccessTimingParameter",           true,  true);
  r.add(SID::SecuredDataTransmission,         "SecuredDataTransmission",         false, true);
  r.add(SID::ControlDTCSetting,               "ControlDTCSetting",               true,  true);
  r.add(SID::ResponseOnEvent,                 "ResponseOnEvent",                 true,  true);
  r.add(SID::LinkControl,                     "LinkControl",                     true,  true);
  return r;
}

} // namespace udscore
