#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace ump {

/// Decoded UMP variable-length integer.
///
/// The encoded size (1 to 5 bytes) is given by the number of leading set bits of the first byte:
///   0xxxxxxx                             -> 1 byte,  7 value bits
///   10xxxxxx + 1 byte                    -> 2 bytes, 14 value bits
///   110xxxxx + 2 bytes                   -> 3 bytes, 21 value bits
///   1110xxxx + 3 bytes                   -> 4 bytes, 28 value bits
///   11110xxx + 4 bytes (little endian)   -> 5 bytes, 32 value bits (the 3 low bits of the first byte are ignored)
///   11111xxx                             -> invalid
/// In the multi-byte forms, the value bits of the first byte are the least significant ones.
struct VarInt {
  enum class Status : uint8_t {
    Ok,
    /// Not enough bytes to decode the value yet.
    BufferUnderrun,
    /// First byte has its five top bits set.
    Invalid,
  };

  static constexpr std::size_t kMaxSize = 5;

  [[nodiscard]] constexpr bool ok() const noexcept { return status == Status::Ok; }

  uint32_t value{0};
  uint8_t size{0};  ///< Number of encoded bytes, 0 unless status is Ok
  Status status{Status::BufferUnderrun};
};

/// Encoded size of the varint starting with firstByte, 0 if firstByte cannot start a varint.
[[nodiscard]] constexpr uint8_t VarIntSize(std::byte firstByte) noexcept {
  const auto byte = static_cast<uint8_t>(firstByte);
  uint8_t size = 1;
  for (uint8_t mask = 0x80; mask != 0x04 && (byte & mask) != 0; mask >>= 1) {
    ++size;
  }
  return size > VarInt::kMaxSize ? uint8_t{0} : size;
}

/// Decode the varint at the beginning of data.
[[nodiscard]] VarInt DecodeVarInt(std::span<const std::byte> data) noexcept;

}  // namespace ump
