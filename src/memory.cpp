#include "udscore/memory.hpp"
#include "udscore/errors.hpp"
#include <string>

namespace udscore {

uint8_t AddressAndLengthIdentifier::make(int size, int addr) {
  if (size < msize_256 || size > msize_4GB) {
    throw ConfigurationError("Size must be an integer between 1 and 4, got " + std::to_string(size));
  }
  if (addr < addr_256B || addr > addr_1024GB) {
    throw ConfigurationError("Addr must be an integer between 1 and 5, got " + std::to_string(addr));
  }
  return static_cast<uint8_t>((size << 4) | addr);
}

} // namespace udscore
