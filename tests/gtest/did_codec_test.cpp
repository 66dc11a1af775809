/**
 * @file did_codec_test.cpp
 * @brief Tests for DID value codecs (did_codec.cpp)
 */

#include <gtest/gtest.h>
#include "udscore/did_codec.hpp"
#include "udscore/errors.hpp"

using namespace udscore;

// Fixed-point codec: engine speed in 0.25 rpm steps, 2 bytes big endian
class EngineSpeedCodec : public DidCodec {
public:
  std::vector<uint8_t> encode(const DidValues& values) const override {
    const auto raw = static_cast<uint16_t>(std::get<double>(values.at(0)) * 4.0);
    return {static_cast<uint8_t>(raw >> 8), static_cast<uint8_t>(raw & 0xFF)};
  }

  DidValues decode(const std::vector<uint8_t>& payload) const override {
    const uint16_t raw = static_cast<uint16_t>((payload.at(0) << 8) | payload.at(1));
    return {raw / 4.0};
  }

  size_t size() const override { return 2; }
};

// ============================================================================
// Layout codec
// ============================================================================

TEST(DidCodecTest, UnsignedBigEndian) {
  DidCodec codec(">H");
  EXPECT_EQ(codec.size(), 2u);
  EXPECT_EQ(codec.encode({uint64_t{3000}}), (std::vector<uint8_t>{0x0B, 0xB8}));

  auto values = codec.decode({0x0B, 0xB8});
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(std::get<uint64_t>(values[0]), 3000u);
}

TEST(DidCodecTest, SignedLittleEndian) {
  DidCodec codec("<h");
  EXPECT_EQ(codec.encode({int64_t{-2}}), (std::vector<uint8_t>{0xFE, 0xFF}));
  EXPECT_EQ(std::get<int64_t>(codec.decode({0xFE, 0xFF})[0]), -2);
}

TEST(DidCodecTest, NetworkOrderAlias) {
  DidCodec codec("!I");
  EXPECT_EQ(codec.encode({uint64_t{0x01020304}}), (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}));
}

TEST(DidCodecTest, Vin) {
  DidCodec codec("17s");
  const std::string vin = "WVWZZZ1JZXW000001";
  std::vector<uint8_t> payload(vin.begin(), vin.end());

  EXPECT_EQ(codec.size(), 17u);
  auto values = codec.decode(payload);
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(std::get<std::string>(values[0]), vin);
  EXPECT_EQ(codec.encode({vin}), payload);
}

TEST(DidCodecTest, StringPaddedAndTruncated) {
  DidCodec codec("4s");
  EXPECT_EQ(codec.encode({std::string("AB")}), (std::vector<uint8_t>{'A', 'B', 0x00, 0x00}));
  EXPECT_EQ(codec.encode({std::string("ABCDEF")}), (std::vector<uint8_t>{'A', 'B', 'C', 'D'}));
}

TEST(DidCodecTest, MixedRecordWithPadding) {
  DidCodec codec(">BxH?");
  EXPECT_EQ(codec.size(), 5u);

  auto bytes = codec.encode({uint64_t{1}, uint64_t{0x0203}, true});
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x01, 0x00, 0x02, 0x03, 0x01}));

  auto values = codec.decode(bytes);
  ASSERT_EQ(values.size(), 3u);
  EXPECT_EQ(std::get<uint64_t>(values[0]), 1u);
  EXPECT_EQ(std::get<uint64_t>(values[1]), 0x0203u);
  EXPECT_TRUE(std::get<bool>(values[2]));
}

TEST(DidCodecTest, RepeatCount) {
  DidCodec codec(">3B");
  EXPECT_EQ(codec.size(), 3u);
  EXPECT_EQ(codec.encode({uint64_t{1}, uint64_t{2}, uint64_t{3}}),
            (std::vector<uint8_t>{0x01, 0x02, 0x03}));
  EXPECT_EQ(codec.decode({0x01, 0x02, 0x03}).size(), 3u);
}

TEST(DidCodecTest, FloatingPoint) {
  DidCodec single(">f");
  EXPECT_EQ(single.encode({1.5}), (std::vector<uint8_t>{0x3F, 0xC0, 0x00, 0x00}));
  EXPECT_DOUBLE_EQ(std::get<double>(single.decode({0x3F, 0xC0, 0x00, 0x00})[0]), 1.5);

  DidCodec dbl("<d");
  auto bytes = dbl.encode({-0.125});
  EXPECT_EQ(bytes.size(), 8u);
  EXPECT_DOUBLE_EQ(std::get<double>(dbl.decode(bytes)[0]), -0.125);
}

TEST(DidCodecTest, IntegerAcceptedForSignedAndUnsignedFields) {
  DidCodec codec(">bB");
  EXPECT_EQ(codec.encode({uint64_t{5}, int64_t{200}}), (std::vector<uint8_t>{0x05, 0xC8}));
}

TEST(DidCodecTest, OutOfRangeValues) {
  EXPECT_THROW(DidCodec(">B").encode({uint64_t{256}}), CodecError);
  EXPECT_THROW(DidCodec(">B").encode({int64_t{-1}}), CodecError);
  EXPECT_THROW(DidCodec(">b").encode({int64_t{128}}), CodecError);
  EXPECT_THROW(DidCodec(">h").encode({int64_t{-32769}}), CodecError);
  EXPECT_NO_THROW(DidCodec(">h").encode({int64_t{-32768}}));
}

TEST(DidCodecTest, WrongValueType) {
  EXPECT_THROW(DidCodec(">H").encode({std::string("x")}), CodecError);
  EXPECT_THROW(DidCodec("4s").encode({uint64_t{1}}), CodecError);
}

TEST(DidCodecTest, WrongValueCount) {
  DidCodec codec(">HH");
  EXPECT_THROW(codec.encode({uint64_t{1}}), CodecError);
  EXPECT_THROW(codec.encode({uint64_t{1}, uint64_t{2}, uint64_t{3}}), CodecError);
}

TEST(DidCodecTest, WrongPayloadLength) {
  DidCodec codec(">H");
  EXPECT_THROW(codec.decode({0x01}), CodecError);
  EXPECT_THROW(codec.decode({0x01, 0x02, 0x03}), CodecError);
}

TEST(DidCodecTest, MalformedLayouts) {
  EXPECT_THROW(DidCodec("Z"), ConfigurationError);
  EXPECT_THROW(DidCodec(">3"), ConfigurationError);
  EXPECT_THROW(DidCodec(""), ConfigurationError);
  EXPECT_THROW(DidCodec("<"), ConfigurationError);
}

// ============================================================================
// Codec without layout, custom codecs
// ============================================================================

TEST(DidCodecTest, BaseCodecWithoutLayout) {
  DidCodec codec;
  EXPECT_FALSE(codec.has_layout());
  EXPECT_THROW(codec.encode({uint64_t{1}}), NotImplementedError);
  EXPECT_THROW(codec.decode({0x01}), NotImplementedError);
  EXPECT_THROW(codec.size(), NotImplementedError);
}

TEST(DidCodecTest, CustomCodec) {
  EngineSpeedCodec codec;
  EXPECT_EQ(codec.encode({750.25}), (std::vector<uint8_t>{0x0B, 0xB9}));
  EXPECT_DOUBLE_EQ(std::get<double>(codec.decode({0x0B, 0xB9})[0]), 750.25);
  EXPECT_EQ(codec.size(), 2u);
}

// ============================================================================
// Configuration resolution
// ============================================================================

TEST(DidConfigTest, InstanceReturnedAsIs) {
  auto codec = std::make_shared<EngineSpeedCodec>();
  EXPECT_EQ(DidCodec::from_config(DidConfig(std::shared_ptr<DidCodec>(codec))), codec);
}

TEST(DidConfigTest, FactoryConstructsCodec) {
  auto codec = DidCodec::from_config(codec_type<EngineSpeedCodec>());
  ASSERT_NE(codec, nullptr);
  EXPECT_NE(dynamic_cast<EngineSpeedCodec*>(codec.get()), nullptr);
}

TEST(DidConfigTest, LayoutStringBuildsGenericCodec) {
  auto codec = DidCodec::from_config(std::string("<I"));
  ASSERT_NE(codec, nullptr);
  EXPECT_TRUE(codec->has_layout());
  EXPECT_EQ(codec->layout(), "<I");
  EXPECT_EQ(codec->size(), 4u);
}

TEST(DidConfigTest, InvalidEntries) {
  EXPECT_THROW(DidCodec::from_config(std::shared_ptr<DidCodec>()), ConfigurationError);
  EXPECT_THROW(DidCodec::from_config(DidCodecFactory()), ConfigurationError);
  EXPECT_THROW(DidCodec::from_config(DidCodecFactory([] { return std::shared_ptr<DidCodec>(); })),
               ConfigurationError);
  EXPECT_THROW(DidCodec::from_config(std::string("?q!")), ConfigurationError);
}

TEST(DidConfigTest, ResolveTable) {
  std::map<DID, DidConfig> config;
  config[0xF190] = std::string("17s");
  config[0x010C] = codec_type<EngineSpeedCodec>();

  auto codecs = resolve_did_config(config);
  ASSERT_EQ(codecs.size(), 2u);
  EXPECT_EQ(codecs.at(0xF190)->size(), 17u);
  EXPECT_EQ(codecs.at(0x010C)->size(), 2u);
}

TEST(DidConfigTest, ResolveErrorNamesDid) {
  std::map<DID, DidConfig> config;
  config[0xF190] = std::string("17s");
  config[0xF18C] = std::string("bogus");

  try {
    resolve_did_config(config);
    FAIL() << "Expected ConfigurationError";
  } catch (const ConfigurationError& e) {
    EXPECT_NE(std::string(e.what()).find("0xF18C"), std::string::npos);
  }
}
