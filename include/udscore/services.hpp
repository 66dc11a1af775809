#ifndef UDSCORE_SERVICES_HPP
#define UDSCORE_SERVICES_HPP

/**
 * @file services.hpp
 * @brief Service identity registry - ISO 14229-1:2013 Table 1 (p. 7)
 *
 * Maps request/response service identifiers to service descriptors. The
 * registry is an explicit object handed to the framers, so tests and
 * protocol variants can each use their own catalog.
 *
 * MESSAGE FORMAT (Section 7.2, pp. 16-17):
 * - Request:  [SID] [Sub-function] [Data...]
 * - Positive: [SID+0x40] [Data...]
 * - Negative: [SID+0x40] [0x7F] [NRC]
 *
 * Service identifier assignments (Table 1):
 * - 0x00-0x0F: Reserved
 * - 0x10-0x3E: Diagnostic and communication management
 * - 0x83-0x88: Remote activation of diagnostic
 */

#include <cstdint>
#include <map>
#include <string>

namespace udscore {

/**
 * @brief UDS Service Identifiers (SID)
 *
 * Positive response SID = Request SID + 0x40 (Section 8.3, p. 33)
 */
enum class SID : uint8_t {
  // === Diagnostic Session Management (Section 9.2-9.3) ===
  DiagnosticSessionControl        = 0x10,  ///< Section 9.2 (p. 36)
  ECUReset                        = 0x11,  ///< Section 9.3 (p. 43)

  // === DTC Services (Section 11.2-11.3) ===
  ClearDiagnosticInformation      = 0x14,  ///< Section 11.2 (p. 175)
  ReadDTCInformation              = 0x19,  ///< Section 11.3 (p. 178)

  // === Data Services (Section 10.2-10.8) ===
  ReadDataByIdentifier            = 0x22,  ///< Section 10.2 (p. 106)
  ReadMemoryByAddress             = 0x23,  ///< Section 10.3 (p. 113)
  ReadScalingDataByIdentifier     = 0x24,  ///< Section 10.4 (p. 119)

  // === Security (Section 9.4-9.5) ===
  SecurityAccess                  = 0x27,  ///< Section 9.4 (p. 47)
  CommunicationControl            = 0x28,  ///< Section 9.5 (p. 53)
  Authentication                  = 0x29,  ///< ISO 14229-1:2020 - PKI auth

  // === Periodic/Dynamic Data (Section 10.5-10.6) ===
  ReadDataByPeriodicIdentifier    = 0x2A,  ///< Section 10.5 (p. 126)
  DynamicallyDefineDataIdentifier = 0x2C,  ///< Section 10.6 (p. 140)

  // === Write Services (Section 10.7-10.8) ===
  WriteDataByIdentifier           = 0x2E,  ///< Section 10.7 (p. 162)
  InputOutputControlByIdentifier  = 0x2F,  ///< Section 12.2 (p. 245)

  // === Routine Control (Section 13.2) ===
  RoutineControl                  = 0x31,  ///< Section 13.2 (p. 260)

  // === Upload/Download (Section 14.2-14.6) ===
  RequestDownload                 = 0x34,  ///< Section 14.2 (p. 270)
  RequestUpload                   = 0x35,  ///< Section 14.3 (p. 275)
  TransferData                    = 0x36,  ///< Section 14.4 (p. 280)
  RequestTransferExit             = 0x37,  ///< Section 14.5 (p. 285)
  RequestFileTransfer             = 0x38,  ///< Section 14.6 (p. 295)

  WriteMemoryByAddress            = 0x3D,  ///< Section 10.8 (p. 167)
  TesterPresent                   = 0x3E,  ///< Section 9.6 (p. 58)

  // === Remote Activation (Section 9.7-9.11) ===
  AccessTimingParameter           = 0x83,  ///< Section 9.7 (p. 61)
  SecuredDataTransmission         = 0x84,  ///< Section 9.8 (p. 66)
  ControlDTCSetting               = 0x85,  ///< Section 9.9 (p. 71)
  ResponseOnEvent                 = 0x86,  ///< Section 9.10 (p. 75)
  LinkControl                     = 0x87   ///< Section 9.11 (p. 99)
};

// Positive response SID = request SID + 0x40
constexpr uint8_t kPositiveResponseOffset = 0x40;

// Negative response marker, follows the response SID (Section 8.4, p. 34)
constexpr uint8_t kNegativeResponseMarker = 0x7F;

// Bit 7 of the sub-function byte: suppressPosRspMsgIndicationBit
constexpr uint8_t kSuppressPositiveResponseBit = 0x80;

/**
 * @brief SecurityAccess (0x27) level
 *
 * The levelid is the requested sub-function with bit 0 cleared, so the
 * requestSeed and sendKey sub-functions of one level share it.
 */
struct SecurityLevel {
  constexpr explicit SecurityLevel(uint8_t level) : levelid(static_cast<uint8_t>(level & 0xFE)) {}

  constexpr bool operator==(const SecurityLevel& other) const { return levelid == other.levelid; }
  constexpr bool operator!=(const SecurityLevel& other) const { return levelid != other.levelid; }

  uint8_t levelid;
};

/**
 * @brief Identity of one diagnostic service
 */
struct ServiceDescriptor {
  uint8_t request_id{0};
  uint8_t response_id{0};
  bool uses_subfunction{false};   ///< Byte 1 of a request is a sub-function
  bool has_response_data{false};  ///< Positive responses carry data after the SID
  std::string name;
};

/**
 * @brief Lookup table of service descriptors, indexed both ways
 *
 * Descriptor addresses stay valid for the lifetime of the registry, so
 * Request and Response keep plain pointers into it.
 */
class ServiceRegistry {
public:
  ServiceRegistry() = default;

  // Requests and Responses point into the registry; copies would not be shared
  ServiceRegistry(const ServiceRegistry&) = delete;
  ServiceRegistry& operator=(const ServiceRegistry&) = delete;
  ServiceRegistry(ServiceRegistry&&) = default;
  ServiceRegistry& operator=(ServiceRegistry&&) = default;

  /**
   * @brief Register a service
   * @throws ConfigurationError on duplicate request/response ID, or a
   *         response ID equal to the negative response marker (0x7F)
   * @return The stored descriptor
   */
  const ServiceDescriptor& add(const ServiceDescriptor& descriptor);

  /// Register a standard-layout service (response = request + 0x40)
  const ServiceDescriptor& add(SID sid, const std::string& name,
                               bool uses_subfunction, bool has_response_data);

  /// Descriptor for a request SID, or nullptr
  const ServiceDescriptor* by_request_id(uint8_t request_id) const;

  /// Descriptor for a positive response SID, or nullptr
  const ServiceDescriptor* by_response_id(uint8_t response_id) const;

  /// Descriptor for a well-known SID, or nullptr if not registered
  const ServiceDescriptor* find(SID sid) const {
    return by_request_id(static_cast<uint8_t>(sid));
  }

  size_t size() const { return by_request_.size(); }
  bool empty() const { return by_request_.empty(); }

  /// Registry populated with the ISO 14229-1 service catalog
  static ServiceRegistry standard();

private:
  std::map<uint8_t, ServiceDescriptor> by_request_;
  std::map<uint8_t, uint8_t> response_to_request_;
};

} // namespace udscore

#endif // UDSCORE_SERVICES_HPP
