#include "udscore/did_codec.hpp"
#include "udscore/errors.hpp"
#include <cctype>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace udscore {

namespace {

bool host_is_little_endian() {
  const uint16_t one = 0x0001;
  uint8_t first;
  std::memcpy(&first, &one, 1);
  return first == 0x01;
}

size_t type_width(char type) {
  switch (type) {
    case 'x': case '?': case 'b': case 'B': case 's': return 1;
    case 'h': case 'H': return 2;
    case 'i': case 'I': case 'l': case 'L': case 'f': return 4;
    case 'q': case 'Q': case 'd': return 8;
    default: return 0;
  }
}

bool is_signed_type(char type) {
  return type == 'b' || type == 'h' || type == 'i' || type == 'l' || type == 'q';
}

bool is_unsigned_type(char type) {
  return type == 'B' || type == 'H' || type == 'I' || type == 'L' || type == 'Q';
}

void put_uint(std::vector<uint8_t>& out, uint64_t v, size_t width, bool little) {
  for (size_t i = 0; i < width; ++i) {
    const size_t shift = little ? i : (width - 1 - i);
    out.push_back(static_cast<uint8_t>(v >> (8 * shift)));
  }
}

uint64_t get_uint(const uint8_t* p, size_t width, bool little) {
  uint64_t v = 0;
  for (size_t i = 0; i < width; ++i) {
    const size_t shift = little ? i : (width - 1 - i);
    v |= static_cast<uint64_t>(p[i]) << (8 * shift);
  }
  return v;
}

int64_t sign_extend(uint64_t raw, size_t width) {
  if (width >= 8) return static_cast<int64_t>(raw);
  const uint64_t sign = uint64_t{1} << (8 * width - 1);
  if (raw & sign) {
    raw |= ~((sign << 1) - 1);
  }
  return static_cast<int64_t>(raw);
}

std::string describe(const DidValue& v) {
  switch (v.index()) {
    case 0: return std::to_string(std::get<int64_t>(v));
    case 1: return std::to_string(std::get<uint64_t>(v));
    case 2: return std::to_string(std::get<double>(v));
    case 3: return std::get<bool>(v) ? "true" : "false";
    default: return "\"" + std::get<std::string>(v) + "\"";
  }
}

int64_t as_signed(const DidValue& v, size_t width) {
  int64_t x;
  if (auto p = std::get_if<int64_t>(&v)) {
    x = *p;
  } else if (auto u = std::get_if<uint64_t>(&v)) {
    if (*u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw CodecError("Value " + describe(v) + " does not fit a signed field");
    }
    x = static_cast<int64_t>(*u);
  } else if (auto b = std::get_if<bool>(&v)) {
    x = *b ? 1 : 0;
  } else {
    throw CodecError("Value " + describe(v) + " is not an integer");
  }

  if (width < 8) {
    const int64_t max = (int64_t{1} << (8 * width - 1)) - 1;
    const int64_t min = -max - 1;
    if (x < min || x > max) {
      throw CodecError("Value " + describe(v) + " out of range for a " +
                       std::to_string(width) + "-byte signed field");
    }
  }
  return x;
}

uint64_t as_unsigned(const DidValue& v, size_t width) {
  uint64_t x;
  if (auto u = std::get_if<uint64_t>(&v)) {
    x = *u;
  } else if (auto p = std::get_if<int64_t>(&v)) {
    if (*p < 0) {
      throw CodecError("Value " + describe(v) + " is negative for an unsigned field");
    }
    x = static_cast<uint64_t>(*p);
  } else if (auto b = std::get_if<bool>(&v)) {
    x = *b ? 1 : 0;
  } else {
    throw CodecError("Value " + describe(v) + " is not an integer");
  }

  if (width < 8 && x > ((uint64_t{1} << (8 * width)) - 1)) {
    throw CodecError("Value " + describe(v) + " out of range for a " +
                     std::to_string(width) + "-byte unsigned field");
  }
  return x;
}

double as_real(const DidValue& v) {
  if (auto d = std::get_if<double>(&v)) return *d;
  if (auto p = std::get_if<int64_t>(&v)) return static_cast<double>(*p);
  if (auto u = std::get_if<uint64_t>(&v)) return static_cast<double>(*u);
  throw CodecError("Value " + describe(v) + " is not a number");
}

bool as_bool(const DidValue& v) {
  if (auto b = std::get_if<bool>(&v)) return *b;
  if (auto p = std::get_if<int64_t>(&v)) return *p != 0;
  if (auto u = std::get_if<uint64_t>(&v)) return *u != 0;
  throw CodecError("Value " + describe(v) + " is not a boolean");
}

} // namespace

DidCodec::DidCodec(const std::string& layout) : layout_(layout) {
  size_t pos = 0;
  little_endian_ = host_is_little_endian();

  if (!layout.empty()) {
    switch (layout[0]) {
      case '<': little_endian_ = true; ++pos; break;
      case '>': case '!': little_endian_ = false; ++pos; break;
      case '=': case '@': ++pos; break;
      default: break;
    }
  }

  while (pos < layout.size()) {
    const char c = layout[pos];
    if (std::isspace(static_cast<unsigned char>(c))) { ++pos; continue; }

    size_t count = 1;
    if (std::isdigit(static_cast<unsigned char>(c))) {
      count = 0;
      while (pos < layout.size() && std::isdigit(static_cast<unsigned char>(layout[pos]))) {
        count = count * 10 + static_cast<size_t>(layout[pos] - '0');
        if (count > 0xFFFF) {
          throw ConfigurationError("DID layout \"" + layout + "\": repeat count too large");
        }
        ++pos;
      }
      if (pos == layout.size()) {
        throw ConfigurationError("DID layout \"" + layout + "\": repeat count without type");
      }
    }

    const char type = layout[pos++];
    const size_t width = type_width(type);
    if (width == 0) {
      throw ConfigurationError("DID layout \"" + layout + "\": unknown field type '" +
                               std::string(1, type) + "'");
    }
    if (count == 0) continue;  // "0s", "0H": no bytes, no value

    fields_.push_back(Field{type, count, width});
    size_ += count * width;
  }

  if (size_ == 0) {
    throw ConfigurationError("DID layout \"" + layout + "\" describes an empty record");
  }
  has_layout_ = true;
}

std::vector<uint8_t> DidCodec::encode(const DidValues& values) const {
  if (!has_layout_) {
    throw NotImplementedError("Cannot encode DID to binary payload. Codec has no \"encode\" implementation");
  }

  size_t expected = 0;
  for (const auto& f : fields_) {
    if (f.type == 'x') continue;
    expected += (f.type == 's') ? 1 : f.count;
  }
  if (values.size() != expected) {
    throw CodecError("DID layout \"" + layout_ + "\" expects " + std::to_string(expected) +
                     " values, got " + std::to_string(values.size()));
  }

  std::vector<uint8_t> out;
  out.reserve(size_);
  size_t vi = 0;

  for (const auto& f : fields_) {
    if (f.type == 'x') {
      out.insert(out.end(), f.count, 0x00);
      continue;
    }

    if (f.type == 's') {
      const auto* s = std::get_if<std::string>(&values[vi]);
      if (!s) {
        throw CodecError("Value " + describe(values[vi]) + " is not a string");
      }
      ++vi;
      for (size_t i = 0; i < f.count; ++i) {
        out.push_back(i < s->size() ? static_cast<uint8_t>((*s)[i]) : 0x00);
      }
      continue;
    }

    for (size_t n = 0; n < f.count; ++n, ++vi) {
      const DidValue& v = values[vi];
      if (is_signed_type(f.type)) {
        put_uint(out, static_cast<uint64_t>(as_signed(v, f.width)), f.width, little_endian_);
      } else if (is_unsigned_type(f.type)) {
        put_uint(out, as_unsigned(v, f.width), f.width, little_endian_);
      } else if (f.type == '?') {
        out.push_back(as_bool(v) ? 0x01 : 0x00);
      } else if (f.type == 'f') {
        const float x = static_cast<float>(as_real(v));
        uint32_t bits;
        std::memcpy(&bits, &x, sizeof bits);
        put_uint(out, bits, 4, little_endian_);
      } else {
        const double x = as_real(v);
        uint64_t bits;
        std::memcpy(&bits, &x, sizeof bits);
        put_uint(out, bits, 8, little_endian_);
      }
    }
  }
  return out;
}

DidValues DidCodec::decode(const std::vector<uint8_t>& payload) const {
  if (!has_layout_) {
    throw NotImplementedError("Cannot decode DID from binary payload. Codec has no \"decode\" implementation");
  }
  if (payload.size() != size_) {
    throw CodecError("DID layout \"" + layout_ + "\" expects " + std::to_string(size_) +
                     " bytes, got " + std::to_string(payload.size()));
  }

  DidValues values;
  const uint8_t* p = payload.data();

  for (const auto& f : fields_) {
    if (f.type == 'x') {
      p += f.count;
      continue;
    }

    if (f.type == 's') {
      values.emplace_back(std::string(reinterpret_cast<const char*>(p), f.count));
      p += f.count;
      continue;
    }

    for (size_t n = 0; n < f.count; ++n, p += f.width) {
      const uint64_t raw = get_uint(p, f.width, little_endian_);
      if (is_signed_type(f.type)) {
        values.emplace_back(sign_extend(raw, f.width));
      } else if (is_unsigned_type(f.type)) {
        values.emplace_back(raw);
      } else if (f.type == '?') {
        values.emplace_back(raw != 0);
      } else if (f.type == 'f') {
        const uint32_t bits = static_cast<uint32_t>(raw);
        float x;
        std::memcpy(&x, &bits, sizeof x);
        values.emplace_back(static_cast<double>(x));
      } else {
        double x;
        std::memcpy(&x, &raw, sizeof x);
        values.emplace_back(x);
      }
    }
  }
  return values;
}

size_t DidCodec::size() const {
  if (!has_layout_) {
    throw NotImplementedError("Cannot tell the payload size. Codec has no \"size\" implementation");
  }
  return size_;
}

std::shared_ptr<DidCodec> DidCodec::from_config(const DidConfig& config) {
  if (auto instance = std::get_if<std::shared_ptr<DidCodec>>(&config)) {
    if (!*instance) {
      throw ConfigurationError("DID codec instance is null");
    }
    return *instance;
  }

  if (auto factory = std::get_if<DidCodecFactory>(&config)) {
    if (!*factory) {
      throw ConfigurationError("DID codec factory is empty");
    }
    auto codec = (*factory)();
    if (!codec) {
      throw ConfigurationError("DID codec factory produced no codec");
    }
    return codec;
  }

  return std::make_shared<DidCodec>(std::get<std::string>(config));
}

std::map<DID, std::shared_ptr<DidCodec>> resolve_did_config(
    const std::map<DID, DidConfig>& config) {
  std::map<DID, std::shared_ptr<DidCodec>> codecs;
  for (const auto& entry : config) {
    try {
      codecs.emplace(entry.first, DidCodec::from_config(entry.second));
    } catch (const ConfigurationError& e) {
      std::ostringstream oss;
      oss << "DID 0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
          << entry.first << ": " << e.what();
      throw ConfigurationError(oss.str());
    }
  }
  return codecs;
}

} // namespace udscore
