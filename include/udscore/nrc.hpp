#ifndef UDSCORE_NRC_HPP
#define UDSCORE_NRC_HPP

/**
 * @file nrc.hpp
 * @brief Response codes - ISO 14229-1:2013 Annex A, ISO 15764 extension
 *
 * Negative Response Message Format (Section 8.4, p. 34):
 *   [SID+0x40] [0x7F] [NRC]
 *
 * NRC Ranges (Table A.1):
 *   0x00:       PositiveResponse (not an NRC, used for comparison)
 *   0x10-0x2F:  General NRCs
 *   0x31-0x37:  Request/security NRCs
 *   0x38-0x4F:  Reserved by ISO 15764 (extended data link security)
 *   0x70-0x78:  Upload/download NRCs
 *   0x7E-0x7F:  Session NRCs
 *   0x80-0xFF:  Condition NRCs (vehicle state)
 */

#include <cstdint>
#include <optional>
#include <string>

namespace udscore {
namespace nrc {

// ISO 14229-1 reserves 0x38-0x4F for ISO 15764; its codes start at this offset
constexpr uint8_t kSecurityExtensionOffset = 0x38;

/**
 * @brief Response codes per ISO 14229-1:2013 Table A.1
 *
 * CRITICAL NRCs for protocol logic above the framer:
 * - 0x78: ResponsePending - keep waiting with P2* timeout
 * - 0x21: BusyRepeatRequest - retry after P2
 */
enum class Code : uint8_t {
    PositiveResponse                            = 0x00,

    // === General NRCs (0x10-0x14) ===
    GeneralReject                               = 0x10,
    ServiceNotSupported                         = 0x11,
    SubFunctionNotSupported                     = 0x12,
    IncorrectMessageLengthOrInvalidFormat       = 0x13,
    ResponseTooLong                             = 0x14,

    // === Busy / conditions (0x21-0x26) ===
    BusyRepeatRequest                           = 0x21,
    ConditionsNotCorrect                        = 0x22,
    RequestSequenceError                        = 0x24,
    NoResponseFromSubnetComponent               = 0x25,
    FailurePreventsExecutionOfRequestedAction   = 0x26,

    // === Range / security (0x31-0x37) ===
    RequestOutOfRange                           = 0x31,
    SecurityAccessDenied                        = 0x33,
    InvalidKey                                  = 0x35,
    ExceedNumberOfAttempts                      = 0x36,
    RequiredTimeDelayNotExpired                 = 0x37,

    // === ISO 15764 extended data link security (0x38 + n) ===
    GeneralSecurityViolation                    = kSecurityExtensionOffset + 0,
    SecuredModeRequested                        = kSecurityExtensionOffset + 1,
    InsufficientProtection                      = kSecurityExtensionOffset + 2,
    TerminationWithSignatureRequested           = kSecurityExtensionOffset + 3,
    AccessDenied                                = kSecurityExtensionOffset + 4,
    VersionNotSupported                         = kSecurityExtensionOffset + 5,
    SecuredLinkNotSupported                     = kSecurityExtensionOffset + 6,
    CertificateNotAvailable                     = kSecurityExtensionOffset + 7,
    AuditTrailInformationNotAvailable           = kSecurityExtensionOffset + 8,

    // === Upload/Download (0x70-0x73) ===
    UploadDownloadNotAccepted                   = 0x70,
    TransferDataSuspended                       = 0x71,
    GeneralProgrammingFailure                   = 0x72,
    WrongBlockSequenceCounter                   = 0x73,

    // === Response Pending (0x78) ===
    RequestCorrectlyReceived_ResponsePending    = 0x78,

    // === Session NRCs (0x7E-0x7F) ===
    SubFunctionNotSupportedInActiveSession      = 0x7E,
    ServiceNotSupportedInActiveSession          = 0x7F,

    // === Vehicle conditions (0x81-0x93) ===
    RpmTooHigh                                  = 0x81,
    RpmTooLow                                   = 0x82,
    EngineIsRunning                             = 0x83,
    EngineIsNotRunning                          = 0x84,
    EngineRunTimeTooLow                         = 0x85,
    TemperatureTooHigh                          = 0x86,
    TemperatureTooLow                           = 0x87,
    VehicleSpeedTooHigh                         = 0x88,
    VehicleSpeedTooLow                          = 0x89,
    ThrottlePedalTooHigh                        = 0x8A,
    ThrottlePedalTooLow                         = 0x8B,
    TransmissionRangeNotInNeutral               = 0x8C,
    TransmissionRangeNotInGear                  = 0x8D,
    ISOSAEReserved                              = 0x8E,
    BrakeSwitchNotClosed                        = 0x8F,
    ShifterLeverNotInPark                       = 0x90,
    TorqueConverterClutchLocked                 = 0x91,
    VoltageTooHigh                              = 0x92,
    VoltageTooLow                               = 0x93
};

/**
 * @brief NRC category, for retry/abort decisions above the framer
 */
enum class Category {
    Positive,
    GeneralReject,      // Unrecoverable errors
    Busy,               // ECU is busy, retry may succeed
    ConditionsNotMet,   // Preconditions not satisfied
    SecurityIssue,      // Security access problems
    ProgrammingError,   // Flash/programming errors
    SessionIssue,       // Wrong diagnostic session
    VehicleCondition,   // Vehicle state not suitable
    ResponsePending,    // Long operation in progress
    Unknown
};

/// True if the byte value is one of the registered codes
bool is_registered(uint8_t code);

/**
 * @brief Symbolic name of a response code
 *
 * "" for an absent code, the constant name for a registered one,
 * the decimal value otherwise. Never fails.
 */
std::string get_name(std::optional<uint8_t> code);

inline std::string get_name(Code code) {
    return get_name(static_cast<uint8_t>(code));
}

/**
 * @brief Whether a code denotes a negative response
 *
 * False for an absent code and for PositiveResponse. Unregistered values
 * also yield false: they are unknown, not confirmed negative.
 */
bool is_negative(std::optional<uint8_t> code);

inline bool is_negative(Code code) {
    return is_negative(static_cast<uint8_t>(code));
}

/// Human-readable description ("Request Out Of Range"), "Unknown NRC" if unregistered
std::string description(uint8_t code);

/// Category for decision making
Category category(uint8_t code);

inline bool is_response_pending(uint8_t code) {
    return code == static_cast<uint8_t>(Code::RequestCorrectlyReceived_ResponsePending);
}

/// Format for logging, e.g. "0x22: Conditions Not Correct"
std::string format_for_log(uint8_t code);

} // namespace nrc
} // namespace udscore

#endif // UDSCORE_NRC_HPP
