#include "ump/part-framer.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ump/part.hpp"
#include "ump/raw-bytes.hpp"
#include "ump/ump-protocol.hpp"
#include "ump/ump-stream-builder.hpp"
#include "ump/varint.hpp"
#include "ump/vector.hpp"

namespace ump {

using test::UmpStreamBuilder;

class PartFramerTest : public ::testing::Test {
 protected:
  PartFramer::Result frame(std::span<const std::byte> data) { return framer.frame(data, parts, partial); }

  PartFramer framer{1024U * 1024U};
  vector<Part> parts;
  std::optional<PartialState> partial;
};

TEST(ParsePartHeader, SingleByteFields) {
  UmpStreamBuilder builder;
  builder.header(21, 5);
  PartHeader header{};
  ASSERT_EQ(ParsePartHeader(builder.bytes(), header), VarInt::Status::Ok);
  EXPECT_EQ(header.type, 21U);
  EXPECT_EQ(header.length, 5U);
  EXPECT_EQ(header.size, 2);
}

TEST(ParsePartHeader, TypeIsAVarIntToo) {
  UmpStreamBuilder builder;
  builder.header(21, 300, /*typeSize=*/3, /*lengthSize=*/2);
  PartHeader header{};
  ASSERT_EQ(ParsePartHeader(builder.bytes(), header), VarInt::Status::Ok);
  EXPECT_EQ(header.type, 21U);
  EXPECT_EQ(header.length, 300U);
  EXPECT_EQ(header.size, 5);
}

TEST(ParsePartHeader, IncompleteLengthIsUnderrun) {
  UmpStreamBuilder builder;
  builder.header(20, 1U << 20);  // 3 bytes length
  PartHeader header{};
  EXPECT_EQ(ParsePartHeader(builder.bytes().first(2), header), VarInt::Status::BufferUnderrun);
  EXPECT_EQ(ParsePartHeader(builder.bytes().first(1), header), VarInt::Status::BufferUnderrun);
  EXPECT_EQ(ParsePartHeader({}, header), VarInt::Status::BufferUnderrun);
}

TEST(ParsePartHeader, InvalidLength) {
  std::array<std::byte, 2> raw{std::byte{21}, std::byte{0xFC}};
  PartHeader header{};
  EXPECT_EQ(ParsePartHeader(raw, header), VarInt::Status::Invalid);
}

TEST_F(PartFramerTest, EmptyBuffer) {
  const auto res = frame({});
  EXPECT_EQ(res.status, PartFramer::Status::Exhausted);
  EXPECT_EQ(res.consumed, 0U);
  EXPECT_TRUE(parts.empty());
}

TEST_F(PartFramerTest, SeveralCompleteParts) {
  UmpStreamBuilder builder;
  builder.part(static_cast<uint32_t>(PartType::MediaHeader), "header").part(21, "media bytes").part(22, "");

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::Exhausted);
  EXPECT_EQ(res.consumed, builder.size());
  EXPECT_FALSE(partial);
  ASSERT_EQ(parts.size(), 3U);
  EXPECT_EQ(parts[0].type, 20U);
  EXPECT_EQ(parts[0].payload.asStringView(), "header");
  EXPECT_EQ(parts[1].type, 21U);
  EXPECT_EQ(parts[1].payload.asStringView(), "media bytes");
  EXPECT_EQ(parts[2].type, 22U);
  EXPECT_TRUE(parts[2].empty());
}

TEST_F(PartFramerTest, ZeroLengthPartIsCompleteImmediately) {
  UmpStreamBuilder builder;
  builder.header(21, 0);

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::Exhausted);
  EXPECT_EQ(res.consumed, 2U);
  EXPECT_FALSE(partial);
  ASSERT_EQ(parts.size(), 1U);
  EXPECT_EQ(parts[0].type, 21U);
  EXPECT_TRUE(parts[0].payload.empty());
}

TEST_F(PartFramerTest, IncompleteHeaderIsLeftUnconsumed) {
  UmpStreamBuilder builder;
  builder.part(11, "abc").header(300, 1U << 20);
  const std::size_t firstPartSize = 2 + 3;

  for (std::size_t cut = firstPartSize; cut < builder.size(); ++cut) {
    parts.clear();
    const auto res = frame(builder.bytes().first(cut));
    EXPECT_EQ(res.status, PartFramer::Status::NeedMoreData) << cut;
    EXPECT_EQ(res.consumed, firstPartSize) << cut;
    EXPECT_EQ(parts.size(), 1U) << cut;
    EXPECT_FALSE(partial);
  }
}

TEST_F(PartFramerTest, IncompletePayloadOpensPartialState) {
  UmpStreamBuilder builder;
  builder.part(52, "id").header(21, 10).raw("0123");

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::PartialOpen);
  EXPECT_EQ(res.consumed, builder.size());
  ASSERT_EQ(parts.size(), 1U);
  EXPECT_EQ(parts[0].type, 52U);
  ASSERT_TRUE(partial);
  EXPECT_EQ(partial->type, 21U);
  EXPECT_EQ(partial->declaredLength, 10U);
  EXPECT_EQ(partial->bytesAccumulated, 4U);
  EXPECT_EQ(partial->remaining(), 6U);
  EXPECT_FALSE(partial->complete());
  EXPECT_EQ(partial->buffer.asStringView(), "0123");
}

TEST_F(PartFramerTest, HeaderWithoutPayloadByteIsLeftUnconsumed) {
  UmpStreamBuilder builder;
  builder.part(52, "id").header(21, 10);

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::NeedMoreData);
  EXPECT_EQ(res.consumed, 4U);
  EXPECT_FALSE(partial);
  ASSERT_EQ(parts.size(), 1U);
}

TEST_F(PartFramerTest, EmptyPartAtEndOfBufferIsComplete) {
  UmpStreamBuilder builder;
  builder.header(22, 0);

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::Exhausted);
  EXPECT_EQ(res.consumed, 2U);
  ASSERT_EQ(parts.size(), 1U);
  EXPECT_TRUE(parts[0].empty());
}

TEST_F(PartFramerTest, UnknownTypesAreOpaqueParts) {
  UmpStreamBuilder builder;
  builder.part(39, "x").part(41, "y").part(1000, "z").part(0xFFFFFFFFU, "w");

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::Exhausted);
  ASSERT_EQ(parts.size(), 4U);
  EXPECT_EQ(parts[2].type, 1000U);
  EXPECT_EQ(parts[3].type, 0xFFFFFFFFU);
  EXPECT_EQ(parts[3].payload.asStringView(), "w");
}

TEST_F(PartFramerTest, InvalidVarIntStopsAtHeader) {
  UmpStreamBuilder builder;
  builder.part(21, "ok").raw(std::array{std::byte{0xF8}, std::byte{0x00}});

  const auto res = frame(builder.bytes());
  EXPECT_EQ(res.status, PartFramer::Status::InvalidVarInt);
  EXPECT_TRUE(res.isError());
  EXPECT_EQ(res.consumed, 4U);
  EXPECT_EQ(parts.size(), 1U);
}

TEST_F(PartFramerTest, DeclaredLengthAboveMaximumIsRejectedBeforeAllocation) {
  PartFramer smallFramer(16);
  UmpStreamBuilder builder;
  builder.part(21, "0123456789abcdef").header(21, 17);

  const auto res = smallFramer.frame(builder.bytes(), parts, partial);
  EXPECT_EQ(res.status, PartFramer::Status::PartSizeOverflow);
  EXPECT_EQ(res.consumed, 2U + 16U);
  EXPECT_EQ(parts.size(), 1U);
  EXPECT_FALSE(partial);
}

TEST(PartialState, AccumulateStopsAtDeclaredLength) {
  PartialState state;
  state.type = 21;
  state.declaredLength = 5;

  const auto payload = test::MakePayload(8);
  EXPECT_EQ(state.accumulate(payload.view().first(3)), 3U);
  EXPECT_FALSE(state.complete());
  EXPECT_EQ(state.accumulate(payload.view().subspan(3)), 2U);
  EXPECT_TRUE(state.complete());
  EXPECT_EQ(state.buffer.view().size(), 5U);
  EXPECT_EQ(state.accumulate(payload.view()), 0U);
}

}  // namespace ump
