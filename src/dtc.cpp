#include "udscore/dtc.hpp"
#include <sstream>
#include <iomanip>

namespace udscore {

uint8_t Dtc::Status::get_byte() const {
  uint8_t byte = 0;
  byte |= test_failed                              ? StatusMask::TestFailed : 0;
  byte |= test_failed_this_operation_cycle         ? StatusMask::TestFailedThisOperationCycle : 0;
  byte |= pending                                  ? StatusMask::PendingDTC : 0;
  byte |= confirmed                                ? StatusMask::ConfirmedDTC : 0;
  byte |= test_not_completed_since_last_clear      ? StatusMask::TestNotCompletedSinceLastClear : 0;
  byte |= test_failed_since_last_clear             ? StatusMask::TestFailedSinceLastClear : 0;
  byte |= test_not_completed_this_operation_cycle  ? StatusMask::TestNotCompletedThisOperationCycle : 0;
  byte |= warning_indicator_requested              ? StatusMask::WarningIndicatorRequested : 0;
  return byte;
}

void Dtc::Status::set_byte(uint8_t byte) {
  test_failed                             = (byte & StatusMask::TestFailed) != 0;
  test_failed_this_operation_cycle        = (byte & StatusMask::TestFailedThisOperationCycle) != 0;
  pending                                 = (byte & StatusMask::PendingDTC) != 0;
  confirmed                               = (byte & StatusMask::ConfirmedDTC) != 0;
  test_not_completed_since_last_clear     = (byte & StatusMask::TestNotCompletedSinceLastClear) != 0;
  test_failed_since_last_clear            = (byte & StatusMask::TestFailedSinceLastClear) != 0;
  test_not_completed_this_operation_cycle = (byte & StatusMask::TestNotCompletedThisOperationCycle) != 0;
  warning_indicator_requested             = (byte & StatusMask::WarningIndicatorRequested) != 0;
}

void Dtc::update_status(const StatusUpdate& u) {
  if (u.test_failed)                             status.test_failed = *u.test_failed;
  if (u.test_failed_this_operation_cycle)        status.test_failed_this_operation_cycle = *u.test_failed_this_operation_cycle;
  if (u.pending)                                 status.pending = *u.pending;
  if (u.confirmed)                               status.confirmed = *u.confirmed;
  if (u.test_not_completed_since_last_clear)     status.test_not_completed_since_last_clear = *u.test_not_completed_since_last_clear;
  if (u.test_failed_since_last_clear)            status.test_failed_since_last_clear = *u.test_failed_since_last_clear;
  if (u.test_not_completed_this_operation_cycle) status.test_not_completed_this_operation_cycle = *u.test_not_completed_this_operation_cycle;
  if (u.warning_indicator_requested)             status.warning_indicator_requested = *u.warning_indicator_requested;
}

std::string Dtc::to_string() const {
  std::ostringstream oss;
  oss << "<DTC " << format_dtc_code(id) << " (0x" << std::hex << std::uppercase
      << std::setw(6) << std::setfill('0') << id << ") status=0x" << std::setw(2)
      << static_cast<int>(status.get_byte()) << " [" << describe_dtc_status(status.get_byte())
      << "] severity=" << severity_name(severity) << ">";
  return oss.str();
}

uint32_t parse_dtc_code(const uint8_t* bytes) {
  return (static_cast<uint32_t>(bytes[0]) << 16) |
         (static_cast<uint32_t>(bytes[1]) << 8) |
         static_cast<uint32_t>(bytes[2]);
}

std::vector<uint8_t> encode_dtc_code(uint32_t dtc_code) {
  return {
    static_cast<uint8_t>((dtc_code >> 16) & 0xFF),
    static_cast<uint8_t>((dtc_code >> 8) & 0xFF),
    static_cast<uint8_t>(dtc_code & 0xFF)
  };
}

std::string format_dtc_code(uint32_t dtc_code) {
  // SAE J2012: bits 23-22 select the system letter, bits 21-8 are the four
  // code digits, the low byte is the failure type
  static const char kSystem[] = {'P', 'C', 'B', 'U'};
  const uint8_t high = static_cast<uint8_t>((dtc_code >> 16) & 0xFF);

  std::ostringstream oss;
  oss << kSystem[(high >> 6) & 0x03]
      << std::hex << std::uppercase
      << static_cast<int>((high >> 4) & 0x03)
      << static_cast<int>(high & 0x0F)
      << std::setfill('0') << std::setw(2) << static_cast<int>((dtc_code >> 8) & 0xFF)
      << '-' << std::setw(2) << static_cast<int>(dtc_code & 0xFF);
  return oss.str();
}

std::string describe_dtc_status(uint8_t status) {
  std::ostringstream oss;
  bool first = true;

  auto add_flag = [&](const char* name) {
    if (!first) oss << ", ";
    oss << name;
    first = false;
  };

  if (status & StatusMask::TestFailed) add_flag("TestFailed");
  if (status & StatusMask::TestFailedThisOperationCycle) add_flag("TestFailedThisCycle");
  if (status & StatusMask::PendingDTC) add_flag("Pending");
  if (status & StatusMask::ConfirmedDTC) add_flag("Confirmed");
  if (status & StatusMask::TestNotCompletedSinceLastClear) add_flag("NotCompletedSinceClear");
  if (status & StatusMask::TestFailedSinceLastClear) add_flag("FailedSinceClear");
  if (status & StatusMask::TestNotCompletedThisOperationCycle) add_flag("NotCompletedThisCycle");
  if (status & StatusMask::WarningIndicatorRequested) add_flag("WarningIndicator");

  if (first) return "None";
  return oss.str();
}

const char* severity_name(Dtc::Severity severity) {
  switch (severity) {
    case Dtc::Severity::NotAvailable:     return "Not Available";
    case Dtc::Severity::MaintenanceOnly:  return "Maintenance Only";
    case Dtc::Severity::CheckAtNextHalt:  return "Check At Next Halt";
    case Dtc::Severity::CheckImmediately: return "Check Immediately";
    default:                              return "Unknown";
  }
}

} // namespace udscore
