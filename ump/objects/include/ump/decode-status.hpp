#pragma once

#include <cstdint>
#include <string_view>

namespace ump {

/// Outcome of a decoder operation. Every status other than Ok is terminal for the stream.
enum class DecodeStatus : uint8_t {
  Ok,
  /// A varint starts with five set bits.
  InvalidVarInt,
  /// A continuation does not belong to the open partial part (strict policy only).
  PartialTypeMismatch,
  /// A declared part length exceeds DecoderConfig::maxPartSize.
  PartSizeOverflow,
  /// The stream ended inside a part header or payload.
  TruncatedStream,
};

constexpr std::string_view DecodeStatusName(DecodeStatus status) noexcept {
  switch (status) {
    case DecodeStatus::Ok:
      return "OK";
    case DecodeStatus::InvalidVarInt:
      return "INVALID_VARINT";
    case DecodeStatus::PartialTypeMismatch:
      return "PARTIAL_TYPE_MISMATCH";
    case DecodeStatus::PartSizeOverflow:
      return "PART_SIZE_OVERFLOW";
    case DecodeStatus::TruncatedStream:
      return "TRUNCATED_STREAM";
    default:
      return "UNKNOWN";
  }
}

struct DecodeResult {
  [[nodiscard]] bool isSuccess() const noexcept { return status == DecodeStatus::Ok; }

  DecodeStatus status{DecodeStatus::Ok};
  const char* errorMessage{nullptr};
};

}  // namespace ump
