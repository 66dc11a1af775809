#ifndef UDSCORE_DID_CODEC_HPP
#define UDSCORE_DID_CODEC_HPP

/**
 * @file did_codec.hpp
 * @brief Data Identifier value codecs - ISO 14229-1:2013 Section 10.2 / Annex C
 *
 * A DidCodec converts the value of one DID to and from its fixed-size binary
 * record, as carried by ReadDataByIdentifier (0x22) and
 * WriteDataByIdentifier (0x2E).
 *
 * The generic codec is driven by a compact layout string:
 *
 *   [byte order] ([count] type)...
 *
 *   Byte order:  '<' little endian, '>' or '!' big endian,
 *                '=' or '@' host order (default). Sizes are always the
 *                standard ones below; no alignment padding is inserted.
 *
 *   Type  Size  Value
 *   x     1     pad byte, consumes no value
 *   ?     1     bool
 *   b/B   1     int8 / uint8
 *   h/H   2     int16 / uint16
 *   i/I   4     int32 / uint32
 *   l/L   4     int32 / uint32
 *   q/Q   8     int64 / uint64
 *   f     4     IEEE 754 single
 *   d     8     IEEE 754 double
 *   s     n     string of [count] bytes, one value (zero padded / truncated)
 *
 * Usage:
 * @code
 *   auto vin = udscore::DidCodec::from_config(std::string("17s"));
 *   auto values = vin->decode(payload);        // {std::string("WVW...")}
 *
 *   auto rpm = udscore::DidCodec::from_config(std::string(">H"));
 *   auto bytes = rpm->encode({uint64_t{3000}}); // {0x0B, 0xB8}
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace udscore {

using DID = uint16_t;

/// One decoded field
using DidValue = std::variant<int64_t, uint64_t, double, bool, std::string>;
using DidValues = std::vector<DidValue>;

class DidCodec;

using DidCodecFactory = std::function<std::shared_ptr<DidCodec>()>;

/**
 * @brief Ways a client configuration can name the codec of a DID
 *
 * - an existing codec instance (returned as is)
 * - a factory building a codec (called once, see codec_type<T>())
 * - a layout string for the generic codec
 */
using DidConfig = std::variant<std::shared_ptr<DidCodec>, DidCodecFactory, std::string>;

/**
 * @brief Encode/decode strategy for a single DID value
 *
 * A default-constructed DidCodec has no layout; its encode, decode and size
 * throw NotImplementedError. Subclasses override all three, or pass a
 * layout string to the base constructor.
 */
class DidCodec {
public:
  DidCodec() = default;

  /// @throws ConfigurationError if the layout string is malformed
  explicit DidCodec(const std::string& layout);

  virtual ~DidCodec() = default;

  /// @throws NotImplementedError without a layout, CodecError on bad values
  virtual std::vector<uint8_t> encode(const DidValues& values) const;

  /// @throws NotImplementedError without a layout, CodecError on length mismatch
  virtual DidValues decode(const std::vector<uint8_t>& payload) const;

  /// Encoded record length in bytes
  virtual size_t size() const;

  const std::string& layout() const { return layout_; }
  bool has_layout() const { return has_layout_; }

  /// @throws ConfigurationError on a null instance, empty factory or bad layout
  static std::shared_ptr<DidCodec> from_config(const DidConfig& config);

private:
  struct Field {
    char type;
    size_t count;  ///< Repeat count, or byte length for 's'
    size_t width;  ///< Bytes per element
  };

  std::string layout_;
  std::vector<Field> fields_;
  bool little_endian_{false};
  bool has_layout_{false};
  size_t size_{0};
};

/// Factory for a codec type default-constructed on resolution
template <typename T>
DidCodecFactory codec_type() {
  return []() -> std::shared_ptr<DidCodec> { return std::make_shared<T>(); };
}

/**
 * @brief Resolve every entry of a DID configuration table
 * @throws ConfigurationError naming the offending DID
 */
std::map<DID, std::shared_ptr<DidCodec>> resolve_did_config(
    const std::map<DID, DidConfig>& config);

} // namespace udscore

#endif // UDSCORE_DID_CODEC_HPP
