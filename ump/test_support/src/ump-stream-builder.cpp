#include "ump/ump-stream-builder.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <utility>

#include "ump/raw-bytes.hpp"
#include "ump/vector.hpp"

namespace ump::test {

namespace {

constexpr uint8_t ShortestVarIntSize(uint32_t value) {
  if (value < (1U << 7)) {
    return 1;
  }
  if (value < (1U << 14)) {
    return 2;
  }
  if (value < (1U << 21)) {
    return 3;
  }
  if (value < (1U << 28)) {
    return 4;
  }
  return 5;
}

}  // namespace

void AppendVarInt(RawBytes& out, uint32_t value, uint8_t size) {
  if (size == 0 || size > 5 || (size < 5 && ShortestVarIntSize(value) > size)) {
    throw std::invalid_argument("value does not fit in the requested varint size");
  }

  std::array<std::byte, 5> buf{};
  switch (size) {
    case 1:
      buf[0] = static_cast<std::byte>(value);
      break;
    case 2:
      buf[0] = static_cast<std::byte>(0x80U | (value & 0x3FU));
      buf[1] = static_cast<std::byte>(value >> 6);
      break;
    case 3:
      buf[0] = static_cast<std::byte>(0xC0U | (value & 0x1FU));
      buf[1] = static_cast<std::byte>((value >> 5) & 0xFFU);
      buf[2] = static_cast<std::byte>(value >> 13);
      break;
    case 4:
      buf[0] = static_cast<std::byte>(0xE0U | (value & 0x0FU));
      buf[1] = static_cast<std::byte>((value >> 4) & 0xFFU);
      buf[2] = static_cast<std::byte>((value >> 12) & 0xFFU);
      buf[3] = static_cast<std::byte>(value >> 20);
      break;
    default:
      buf[0] = std::byte{0xF0};
      buf[1] = static_cast<std::byte>(value & 0xFFU);
      buf[2] = static_cast<std::byte>((value >> 8) & 0xFFU);
      buf[3] = static_cast<std::byte>((value >> 16) & 0xFFU);
      buf[4] = static_cast<std::byte>(value >> 24);
      break;
  }
  out.append(buf.data(), size);
}

void AppendVarInt(RawBytes& out, uint32_t value) { AppendVarInt(out, value, ShortestVarIntSize(value)); }

RawBytes MakePayload(std::size_t size, uint8_t seed) {
  RawBytes payload(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    const auto byte = static_cast<std::byte>(((pos % 251U) + (seed * 7U)) & 0xFFU);
    payload.append(&byte, 1U);
  }
  return payload;
}

UmpStreamBuilder& UmpStreamBuilder::part(uint32_t type, std::span<const std::byte> payload) {
  header(type, static_cast<uint32_t>(payload.size()));
  return raw(payload);
}

UmpStreamBuilder& UmpStreamBuilder::header(uint32_t type, uint32_t length, uint8_t typeSize, uint8_t lengthSize) {
  AppendVarInt(_buf, type, typeSize == 0 ? ShortestVarIntSize(type) : typeSize);
  AppendVarInt(_buf, length, lengthSize == 0 ? ShortestVarIntSize(length) : lengthSize);
  return *this;
}

UmpStreamBuilder& UmpStreamBuilder::raw(std::span<const std::byte> bytes) {
  _buf.append(bytes);
  return *this;
}

vector<RawBytes> UmpStreamBuilder::split(std::span<const std::size_t> offsets) const {
  vector<RawBytes> chunks;
  std::size_t begin = 0;
  for (const std::size_t end : offsets) {
    if (end < begin || end > _buf.size()) {
      throw std::invalid_argument("split offsets must be ascending and within the stream");
    }
    chunks.push_back(RawBytes(_buf.view().subspan(begin, end - begin)));
    begin = end;
  }
  chunks.push_back(RawBytes(_buf.view().subspan(begin)));
  return chunks;
}

RawBytes UmpStreamBuilder::release() noexcept { return std::exchange(_buf, RawBytes{}); }

}  // namespace ump::test
