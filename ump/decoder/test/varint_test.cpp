#include "ump/varint.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

#include "ump/raw-bytes.hpp"
#include "ump/ump-stream-builder.hpp"

namespace ump {

namespace {

template <std::size_t N>
std::span<const std::byte> AsSpan(const std::array<std::byte, N>& arr) {
  return std::span<const std::byte>(arr.data(), arr.size());
}

}  // namespace

TEST(VarIntSize, LeadingOnesGiveSize) {
  EXPECT_EQ(VarIntSize(std::byte{0x00}), 1);
  EXPECT_EQ(VarIntSize(std::byte{0x7F}), 1);
  EXPECT_EQ(VarIntSize(std::byte{0x80}), 2);
  EXPECT_EQ(VarIntSize(std::byte{0xBF}), 2);
  EXPECT_EQ(VarIntSize(std::byte{0xC0}), 3);
  EXPECT_EQ(VarIntSize(std::byte{0xDF}), 3);
  EXPECT_EQ(VarIntSize(std::byte{0xE0}), 4);
  EXPECT_EQ(VarIntSize(std::byte{0xEF}), 4);
  EXPECT_EQ(VarIntSize(std::byte{0xF0}), 5);
  EXPECT_EQ(VarIntSize(std::byte{0xF7}), 5);
}

TEST(VarIntSize, FiveLeadingOnesAreInvalid) {
  for (unsigned byte = 0xF8; byte <= 0xFF; ++byte) {
    EXPECT_EQ(VarIntSize(static_cast<std::byte>(byte)), 0) << byte;
  }
}

TEST(VarIntSize, MatchesLeadingOnesForAllBytes) {
  for (unsigned byte = 0; byte <= 0xFF; ++byte) {
    unsigned leadingOnes = 0;
    while (leadingOnes < 8 && (byte & (0x80U >> leadingOnes)) != 0) {
      ++leadingOnes;
    }
    const unsigned expected = leadingOnes >= 5 ? 0 : leadingOnes + 1;
    EXPECT_EQ(VarIntSize(static_cast<std::byte>(byte)), expected) << byte;
  }
}

TEST(DecodeVarInt, SingleByte) {
  std::array<std::byte, 1> raw{std::byte{0x2A}};
  const VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 42U);
  EXPECT_EQ(varInt.size, 1);
}

TEST(DecodeVarInt, TwoBytes) {
  // (0x02 << 6) | (0x81 & 0x3F) = 128 | 1
  std::array<std::byte, 2> raw{std::byte{0x81}, std::byte{0x02}};
  const VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 129U);
  EXPECT_EQ(varInt.size, 2);
}

TEST(DecodeVarInt, ThreeBytes) {
  // 0b110'00011 -> low bits 3, then 0x01 << 5, then 0x02 << 13
  std::array<std::byte, 3> raw{std::byte{0xC3}, std::byte{0x01}, std::byte{0x02}};
  const VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 3U | (1U << 5) | (2U << 13));
  EXPECT_EQ(varInt.size, 3);
}

TEST(DecodeVarInt, FourBytes) {
  std::array<std::byte, 4> raw{std::byte{0xEF}, std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}};
  const VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, (1U << 28) - 1U);
  EXPECT_EQ(varInt.size, 4);
}

TEST(DecodeVarInt, FiveBytesIgnoresLowBitsOfFirstByte) {
  std::array<std::byte, 5> raw{std::byte{0xF0}, std::byte{0x01}, std::byte{0x00}, std::byte{0x00}, std::byte{0x00}};
  VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 1U);
  EXPECT_EQ(varInt.size, 5);

  raw[0] = std::byte{0xF7};
  varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 1U);
}

TEST(DecodeVarInt, FiveBytesLittleEndianFullRange) {
  std::array<std::byte, 5> raw{std::byte{0xF0}, std::byte{0x78}, std::byte{0x56}, std::byte{0x34}, std::byte{0x12}};
  VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 0x12345678U);

  raw = {std::byte{0xF0}, std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}, std::byte{0xFF}};
  varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.value, 0xFFFFFFFFU);
}

TEST(DecodeVarInt, FiveLeadingOnesIsInvalid) {
  std::array<std::byte, 5> raw{std::byte{0xF8}, std::byte{0x01}, std::byte{0x00}, std::byte{0x00}, std::byte{0x00}};
  const VarInt varInt = DecodeVarInt(AsSpan(raw));
  EXPECT_EQ(varInt.status, VarInt::Status::Invalid);
  EXPECT_FALSE(varInt.ok());
  EXPECT_EQ(varInt.size, 0);
}

TEST(DecodeVarInt, InvalidIsReportedEvenWithoutFollowingBytes) {
  std::array<std::byte, 1> raw{std::byte{0xFF}};
  EXPECT_EQ(DecodeVarInt(AsSpan(raw)).status, VarInt::Status::Invalid);
}

TEST(DecodeVarInt, EmptyInputIsUnderrun) {
  EXPECT_EQ(DecodeVarInt({}).status, VarInt::Status::BufferUnderrun);
}

TEST(DecodeVarInt, TruncatedInputIsUnderrun) {
  std::array<std::byte, 5> raw{std::byte{0xF0}, std::byte{0x01}, std::byte{0x02}, std::byte{0x03}, std::byte{0x04}};
  for (std::size_t len = 1; len < raw.size(); ++len) {
    const VarInt varInt = DecodeVarInt(AsSpan(raw).first(len));
    EXPECT_EQ(varInt.status, VarInt::Status::BufferUnderrun) << len;
    EXPECT_EQ(varInt.size, 0) << len;
  }
  EXPECT_TRUE(DecodeVarInt(AsSpan(raw)).ok());
}

TEST(DecodeVarInt, TrailingBytesAreNotConsumed) {
  std::array<std::byte, 3> raw{std::byte{0x81}, std::byte{0x02}, std::byte{0x7F}};
  const VarInt varInt = DecodeVarInt(AsSpan(raw));
  ASSERT_TRUE(varInt.ok());
  EXPECT_EQ(varInt.size, 2);
  EXPECT_EQ(varInt.value, 129U);
}

TEST(DecodeVarInt, DecodesEveryEncodedSize) {
  for (const uint32_t value : {0U, 1U, 127U, 128U, 16383U, 16384U, 2097151U, 2097152U, 268435455U, 268435456U,
                               0xFFFFFFFFU}) {
    for (uint8_t size = 1; size <= 5; ++size) {
      RawBytes encoded;
      try {
        test::AppendVarInt(encoded, value, size);
      } catch (const std::invalid_argument&) {
        continue;  // value does not fit in this size
      }
      const VarInt varInt = DecodeVarInt(encoded.view());
      ASSERT_TRUE(varInt.ok()) << value << " on " << static_cast<int>(size) << " bytes";
      EXPECT_EQ(varInt.value, value) << value << " on " << static_cast<int>(size) << " bytes";
      EXPECT_EQ(varInt.size, size);
    }
  }
}

}  // namespace ump
