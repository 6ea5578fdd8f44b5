//===- unittests/Basic/BinaryCodingTests.cpp ------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "sandlane/Basic/BinaryCoding.h"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace sandlane;
using namespace sandlane::basic;

struct CustomType {
  uint32_t a;
  std::string b;
};

inline bool operator==(const CustomType& lhs, const CustomType& rhs) {
  return lhs.a == rhs.a && lhs.b == rhs.b;
}

namespace sandlane {
namespace basic {

template<>
struct BinaryCodingTraits<CustomType> {
  static inline void encode(const CustomType& value,
                            BinaryEncoder& coder) {
    coder.write(value.a);
    coder.write(value.b);
  }
  static inline void decode(CustomType& value, BinaryDecoder& coder) {
    coder.read(value.a);
    coder.read(value.b);
  }
};

}
}

namespace {

template<typename T>
static std::vector<uint8_t> encode(const T& value) {
  BinaryEncoder encoder;
  encoder.write(value);
  return encoder.contents();
}

template<typename T>
static T decode(const std::vector<uint8_t>& data) {
  BinaryDecoder decoder(data);
  T result{};
  decoder.read(result);
  EXPECT_TRUE(decoder.finish());
  return result;
}

TEST(BinaryCodingTests, basic) {
  EXPECT_EQ(decode<uint8_t>(encode(uint8_t(0xAB))), 0xAB);
  EXPECT_EQ(decode<uint16_t>(encode(uint16_t(0xABCD))), 0xABCD);
  EXPECT_EQ(decode<uint32_t>(encode(uint32_t(0xABCD0123))), 0xABCD0123U);
  EXPECT_EQ(decode<uint64_t>(encode(uint64_t(0xABCD01234567DCBAULL))),
            0xABCD01234567DCBAULL);
  EXPECT_TRUE(decode<bool>(encode(true)));
}

TEST(BinaryCodingTests, littleEndian) {
  auto data = encode(uint32_t(0x01020304));
  EXPECT_EQ(data, (std::vector<uint8_t>{ 0x04, 0x03, 0x02, 0x01 }));
}

TEST(BinaryCodingTests, bytes) {
  BinaryEncoder encoder;
  encoder.writeBytes(StringRef("hello"));
  encoder.writeBytes(StringRef("world"));
  auto result = encoder.contents();

  EXPECT_EQ(StringRef((char*)result.data(), result.size()),
            StringRef("helloworld"));

  BinaryDecoder decoder(result);
  StringRef s1, s2;
  decoder.readBytes(5, s1);
  decoder.readBytes(5, s2);
  EXPECT_EQ(s1, StringRef("hello"));
  EXPECT_EQ(s2, StringRef("world"));
  EXPECT_TRUE(decoder.finish());
}

TEST(BinaryCodingTests, containers) {
  std::vector<CustomType> values{ { 1, "one" }, { 2, "" }, { 3, "three" } };
  EXPECT_EQ(decode<std::vector<CustomType>>(encode(values)), values);
}

TEST(BinaryCodingTests, truncatedInputFails) {
  auto data = encode(CustomType{ 7, "truncated" });
  data.resize(data.size() - 3);

  BinaryDecoder decoder(data);
  CustomType value;
  decoder.read(value);
  EXPECT_TRUE(decoder.hadError());
  EXPECT_FALSE(decoder.finish());
}

TEST(BinaryCodingTests, trailingDataIsNotFinished) {
  auto data = encode(uint32_t(1));
  data.push_back(0);

  BinaryDecoder decoder(data);
  uint32_t value;
  decoder.read(value);
  EXPECT_EQ(value, 1U);
  EXPECT_FALSE(decoder.hadError());
  EXPECT_FALSE(decoder.finish());
}

TEST(BinaryCodingTests, oversizedLengthFails) {
  // A string claiming to be far longer than the data.
  BinaryEncoder encoder;
  encoder.write(uint32_t(0xFFFFFFFF));
  encoder.writeBytes("abc");
  auto data = encoder.contents();

  BinaryDecoder decoder(data);
  std::string value;
  decoder.read(value);
  EXPECT_TRUE(decoder.hadError());
}

}
