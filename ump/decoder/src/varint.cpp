#include "ump/varint.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace ump {

namespace {

constexpr uint32_t Byte(std::span<const std::byte> data, std::size_t pos) noexcept {
  return static_cast<uint32_t>(data[pos]);
}

// Read a 32-bit little-endian value.
constexpr uint32_t Read32LE(std::span<const std::byte> data) noexcept {
  return Byte(data, 0) | (Byte(data, 1) << 8) | (Byte(data, 2) << 16) | (Byte(data, 3) << 24);
}

}  // namespace

VarInt DecodeVarInt(std::span<const std::byte> data) noexcept {
  VarInt ret;

  if (data.empty()) {
    return ret;
  }

  const uint8_t size = VarIntSize(data[0]);
  if (size == 0) [[unlikely]] {
    ret.status = VarInt::Status::Invalid;
    return ret;
  }
  if (data.size() < size) {
    return ret;
  }

  const uint32_t first = Byte(data, 0);
  switch (size) {
    case 1:
      ret.value = first;
      break;
    case 2:
      ret.value = (first & 0x3F) | (Byte(data, 1) << 6);
      break;
    case 3:
      ret.value = (first & 0x1F) | (Byte(data, 1) << 5) | (Byte(data, 2) << 13);
      break;
    case 4:
      ret.value = (first & 0x0F) | (Byte(data, 1) << 4) | (Byte(data, 2) << 12) | (Byte(data, 3) << 20);
      break;
    default:
      // The low bits of the first byte do not contribute, the value is capped to 32 bits.
      ret.value = Read32LE(data.subspan(1));
      break;
  }

  ret.size = size;
  ret.status = VarInt::Status::Ok;
  return ret;
}

}  // namespace ump
