#ifndef UDSCORE_MEMORY_HPP
#define UDSCORE_MEMORY_HPP

/**
 * @file memory.hpp
 * @brief addressAndLengthFormatIdentifier - ISO 14229-1:2013 Annex H
 *
 * Used by ReadMemoryByAddress (0x23), WriteMemoryByAddress (0x3D),
 * RequestDownload (0x34) and RequestUpload (0x35).
 *
 *   [High nibble: memorySize length][Low nibble: memoryAddress length]
 *   Example: 0x24 = 2-byte size, 4-byte address
 */

#include <cstdint>

namespace udscore {

struct AddressAndLengthIdentifier {
  // memoryAddress length selectors
  static constexpr uint8_t addr_256B   = 1;
  static constexpr uint8_t addr_64KB   = 2;
  static constexpr uint8_t addr_16MB   = 3;
  static constexpr uint8_t addr_4GB    = 4;
  static constexpr uint8_t addr_1024GB = 5;

  // memorySize length selectors
  static constexpr uint8_t msize_256  = 1;
  static constexpr uint8_t msize_64KB = 2;
  static constexpr uint8_t msize_16MB = 3;
  static constexpr uint8_t msize_4GB  = 4;

  /**
   * @brief Pack the identifier byte
   * @param size memorySize length in bytes, 1-4
   * @param addr memoryAddress length in bytes, 1-5
   * @throws ConfigurationError on an out of range selector
   */
  static uint8_t make(int size, int addr);

  static uint8_t size_length(uint8_t alfid) { return (alfid >> 4) & 0x0F; }
  static uint8_t address_length(uint8_t alfid) { return alfid & 0x0F; }
};

} // namespace udscore

#endif // UDSCORE_MEMORY_HPP
