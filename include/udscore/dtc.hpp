#ifndef UDSCORE_DTC_HPP
#define UDSCORE_DTC_HPP

/**
 * @file dtc.hpp
 * @brief Diagnostic Trouble Code model - ISO 14229-1:2013 Annex D
 *
 * DTC Format (Annex D, p. 353):
 * - 3 bytes (24 bits): [High][Mid][Low] representing fault code
 * - First two bits of High indicate system: P=Powertrain, C=Chassis, B=Body, U=Network
 *
 * DTC Status Byte Bits (Annex D.2, Table D.3):
 *   Bit 0: testFailed
 *   Bit 1: testFailedThisOperationCycle
 *   Bit 2: pendingDTC
 *   Bit 3: confirmedDTC
 *   Bit 4: testNotCompletedSinceLastClear
 *   Bit 5: testFailedSinceLastClear
 *   Bit 6: testNotCompletedThisOperationCycle
 *   Bit 7: warningIndicatorRequested
 *
 * Usage:
 * @code
 *   udscore::Dtc dtc(0x012345);
 *   dtc.status.set_byte(record[3]);           // full overwrite
 *
 *   udscore::Dtc::StatusUpdate update;
 *   update.confirmed = true;
 *   dtc.update_status(update);                // only 'confirmed' changes
 * @endcode
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace udscore {

namespace StatusMask {
  constexpr uint8_t TestFailed                         = 0x01;  ///< Bit 0
  constexpr uint8_t TestFailedThisOperationCycle       = 0x02;  ///< Bit 1
  constexpr uint8_t PendingDTC                         = 0x04;  ///< Bit 2
  constexpr uint8_t ConfirmedDTC                       = 0x08;  ///< Bit 3
  constexpr uint8_t TestNotCompletedSinceLastClear     = 0x10;  ///< Bit 4
  constexpr uint8_t TestFailedSinceLastClear           = 0x20;  ///< Bit 5
  constexpr uint8_t TestNotCompletedThisOperationCycle = 0x40;  ///< Bit 6
  constexpr uint8_t WarningIndicatorRequested          = 0x80;  ///< Bit 7

  constexpr uint8_t AllDTCs = 0xFF;
}

namespace Group {
  constexpr uint32_t AllDTCs       = 0xFFFFFF;
  constexpr uint32_t Powertrain    = 0x000000;  // P-codes
  constexpr uint32_t Chassis       = 0x400000;  // C-codes
  constexpr uint32_t Body          = 0x800000;  // B-codes
  constexpr uint32_t Network       = 0xC00000;  // U-codes
}

class Dtc {
public:
  /// Classification only; never packed into the status byte
  enum class Severity : uint8_t {
    NotAvailable     = 0,
    MaintenanceOnly  = 1,
    CheckAtNextHalt  = 2,
    CheckImmediately = 4
  };

  struct Status {
    bool test_failed{false};
    bool test_failed_this_operation_cycle{false};
    bool pending{false};
    bool confirmed{false};
    bool test_not_completed_since_last_clear{false};
    bool test_failed_since_last_clear{false};
    bool test_not_completed_this_operation_cycle{false};
    bool warning_indicator_requested{false};

    uint8_t get_byte() const;

    /// Overwrites all eight flags
    void set_byte(uint8_t byte);

    static Status from_byte(uint8_t byte) {
      Status s;
      s.set_byte(byte);
      return s;
    }

    bool operator==(const Status& other) const { return get_byte() == other.get_byte(); }
    bool operator!=(const Status& other) const { return !(*this == other); }
  };

  /// Flags left empty are not touched by update_status()
  struct StatusUpdate {
    std::optional<bool> test_failed;
    std::optional<bool> test_failed_this_operation_cycle;
    std::optional<bool> pending;
    std::optional<bool> confirmed;
    std::optional<bool> test_not_completed_since_last_clear;
    std::optional<bool> test_failed_since_last_clear;
    std::optional<bool> test_not_completed_this_operation_cycle;
    std::optional<bool> warning_indicator_requested;
  };

  explicit Dtc(uint32_t dtc_id) : id(dtc_id & 0xFFFFFF) {}

  void update_status(const StatusUpdate& update);

  std::string to_string() const;

  uint32_t id;  ///< 24-bit DTC number
  Status status{};
  Severity severity{Severity::NotAvailable};
};

/**
 * Parse DTC code from 3 bytes
 */
uint32_t parse_dtc_code(const uint8_t* bytes);

/**
 * Encode DTC code to 3 bytes
 */
std::vector<uint8_t> encode_dtc_code(uint32_t dtc_code);

/**
 * Format DTC code as string (e.g., "P0123-45", "U0100-00")
 */
std::string format_dtc_code(uint32_t dtc_code);

/**
 * Get human-readable description of DTC status
 */
std::string describe_dtc_status(uint8_t status);

const char* severity_name(Dtc::Severity severity);

} // namespace udscore

#endif // UDSCORE_DTC_HPP
