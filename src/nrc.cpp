#include "udscore/nrc.hpp"
#include <unordered_map>
#include <sstream>
#include <iomanip>

namespace udscore {
namespace nrc {

namespace {

struct CodeInfo {
    const char* name;
    const char* description;
};

const std::unordered_map<uint8_t, CodeInfo>& code_table() {
    static const std::unordered_map<uint8_t, CodeInfo> table = {
        {0x00, {"PositiveResponse",                          "Positive Response"}},
        {0x10, {"GeneralReject",                             "General Reject"}},
        {0x11, {"ServiceNotSupported",                       "Service Not Supported"}},
        {0x12, {"SubFunctionNotSupported",                   "Sub-Function Not Supported"}},
        {0x13, {"IncorrectMessageLengthOrInvalidFormat",     "Incorrect Message Length or Invalid Format"}},
        {0x14, {"ResponseTooLong",                           "Response Too Long"}},
        {0x21, {"BusyRepeatRequest",                         "Busy - Repeat Request"}},
        {0x22, {"ConditionsNotCorrect",                      "Conditions Not Correct"}},
        {0x24, {"RequestSequenceError",                      "Request Sequence Error"}},
        {0x25, {"NoResponseFromSubnetComponent",             "No Response From Subnet Component"}},
        {0x26, {"FailurePreventsExecutionOfRequestedAction", "Failure Prevents Execution of Requested Action"}},
        {0x31, {"RequestOutOfRange",                         "Request Out Of Range"}},
        {0x33, {"SecurityAccessDenied",                      "Security Access Denied"}},
        {0x35, {"InvalidKey",                                "Invalid Key"}},
        {0x36, {"ExceedNumberOfAttempts",                    "Exceeded Number Of Attempts"}},
        {0x37, {"RequiredTimeDelayNotExpired",               "Required Time Delay Not Expired"}},
        {0x38, {"GeneralSecurityViolation",                  "General Security Violation"}},
        {0x39, {"SecuredModeRequested",                      "Secured Mode Requested"}},
        {0x3A, {"InsufficientProtection",                    "Insufficient Protection"}},
        {0x3B, {"TerminationWithSignatureRequested",         "Termination With Signature Requested"}},
        {0x3C, {"AccessDenied",                              "Access Denied"}},
        {0x3D, {"VersionNotSupported",                       "Version Not Supported"}},
        {0x3E, {"SecuredLinkNotSupported",                   "Secured Link Not Supported"}},
        {0x3F, {"CertificateNotAvailable",                   "Certificate Not Available"}},
        {0x40, {"AuditTrailInformationNotAvailable",         "Audit Trail Information Not Available"}},
        {0x70, {"UploadDownloadNotAccepted",                 "Upload/Download Not Accepted"}},
        {0x71, {"TransferDataSuspended",                     "Transfer Data Suspended"}},
        {0x72, {"GeneralProgrammingFailure",                 "General Programming Failure"}},
        {0x73, {"WrongBlockSequenceCounter",                 "Wrong Block Sequence Counter"}},
        {0x78, {"RequestCorrectlyReceived_ResponsePending",  "Request Correctly Received - Response Pending"}},
        {0x7E, {"SubFunctionNotSupportedInActiveSession",    "Sub-Function Not Supported In Active Session"}},
        {0x7F, {"ServiceNotSupportedInActiveSession",        "Service Not Supported In Active Session"}},
        {0x81, {"RpmTooHigh",                                "RPM Too High"}},
        {0x82, {"RpmTooLow",                                 "RPM Too Low"}},
        {0x83, {"EngineIsRunning",                           "Engine Is Running"}},
        {0x84, {"EngineIsNotRunning",                        "Engine Is Not Running"}},
        {0x85, {"EngineRunTimeTooLow",                       "Engine Run Time Too Low"}},
        {0x86, {"TemperatureTooHigh",                        "Temperature Too High"}},
        {0x87, {"TemperatureTooLow",                         "Temperature Too Low"}},
        {0x88, {"VehicleSpeedTooHigh",                       "Vehicle Speed Too High"}},
        {0x89, {"VehicleSpeedTooLow",                        "Vehicle Speed Too Low"}},
        {0x8A, {"ThrottlePedalTooHigh",                      "Throttle/Pedal Too High"}},
        {0x8B, {"ThrottlePedalTooLow",                       "Throttle/Pedal Too Low"}},
        {0x8C, {"TransmissionRangeNotInNeutral",             "Transmission Range Not In Neutral"}},
        {0x8D, {"TransmissionRangeNotInGear",                "Transmission Range Not In Gear"}},
        {0x8E, {"ISOSAEReserved",                            "ISO SAE Reserved"}},
        {0x8F, {"BrakeSwitchNotClosed",                      "Brake Switch(es) Not Closed"}},
        {0x90, {"ShifterLeverNotInPark",                     "Shifter Lever Not In Park"}},
        {0x91, {"TorqueConverterClutchLocked",               "Torque Converter Clutch Locked"}},
        {0x92, {"VoltageTooHigh",                            "Voltage Too High"}},
        {0x93, {"VoltageTooLow",                             "Voltage Too Low"}}
    };
    return table;
}

} // namespace

bool is_registered(uint8_t code) {
    return code_table().count(code) != 0;
}

std::string get_name(std::optional<uint8_t> code) {
    if (!code) {
        return "";
    }

    auto it = code_table().find(*code);
    if (it != code_table().end()) {
        return it->second.name;
    }

    return std::to_string(static_cast<int>(*code));
}

bool is_negative(std::optional<uint8_t> code) {
    if (!code || *code == static_cast<uint8_t>(Code::PositiveResponse)) {
        return false;
    }
    return is_registered(*code);
}

std::string description(uint8_t code) {
    auto it = code_table().find(code);
    if (it != code_table().end()) {
        return it->second.description;
    }
    return "Unknown NRC";
}

// ============================================================================
// Category classification
// ============================================================================

Category category(uint8_t code) {
    if (!is_registered(code)) {
        return Category::Unknown;
    }

    switch (static_cast<Code>(code)) {
        case Code::PositiveResponse:
            return Category::Positive;

        case Code::RequestCorrectlyReceived_ResponsePending:
            return Category::ResponsePending;

        case Code::BusyRepeatRequest:
            return Category::Busy;

        case Code::ConditionsNotCorrect:
        case Code::RequestSequenceError:
        case Code::NoResponseFromSubnetComponent:
        case Code::FailurePreventsExecutionOfRequestedAction:
            return Category::ConditionsNotMet;

        case Code::SecurityAccessDenied:
        case Code::InvalidKey:
        case Code::ExceedNumberOfAttempts:
        case Code::RequiredTimeDelayNotExpired:
        case Code::GeneralSecurityViolation:
        case Code::SecuredModeRequested:
        case Code::InsufficientProtection:
        case Code::TerminationWithSignatureRequested:
        case Code::AccessDenied:
        case Code::VersionNotSupported:
        case Code::SecuredLinkNotSupported:
        case Code::CertificateNotAvailable:
        case Code::AuditTrailInformationNotAvailable:
            return Category::SecurityIssue;

        case Code::UploadDownloadNotAccepted:
        case Code::TransferDataSuspended:
        case Code::GeneralProgrammingFailure:
        case Code::WrongBlockSequenceCounter:
            return Category::ProgrammingError;

        case Code::SubFunctionNotSupportedInActiveSession:
        case Code::ServiceNotSupportedInActiveSession:
            return Category::SessionIssue;

        case Code::GeneralReject:
        case Code::ServiceNotSupported:
        case Code::SubFunctionNotSupported:
        case Code::IncorrectMessageLengthOrInvalidFormat:
        case Code::ResponseTooLong:
        case Code::RequestOutOfRange:
            return Category::GeneralReject;

        case Code::ISOSAEReserved:
            return Category::Unknown;

        default:
            // 0x81-0x93 vehicle conditions
            return Category::VehicleCondition;
    }
}

std::string format_for_log(uint8_t code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(code) << ": " << description(code);
    return oss.str();
}

} // namespace nrc
} // namespace udscore
