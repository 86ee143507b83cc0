#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ump/part.hpp"
#include "ump/raw-bytes.hpp"
#include "ump/varint.hpp"
#include "ump/vector.hpp"

namespace ump {

/// UMP part header: two independently encoded varints, type then length.
struct PartHeader {
  static constexpr std::size_t kMaxSize = 2 * VarInt::kMaxSize;

  uint32_t type;
  uint32_t length;  ///< Payload length
  uint8_t size;     ///< Number of encoded header bytes
};

/// Parse the part header at the beginning of data.
/// Returns VarInt::Status::Ok and fills 'out' when both varints are complete.
[[nodiscard]] VarInt::Status ParsePartHeader(std::span<const std::byte> data, PartHeader& out) noexcept;

/// Payload of a part received across chunk boundaries.
/// Invariant: bytesAccumulated < declaredLength while the state exists.
struct PartialState {
  [[nodiscard]] uint32_t remaining() const noexcept { return declaredLength - bytesAccumulated; }

  [[nodiscard]] bool complete() const noexcept { return bytesAccumulated == declaredLength; }

  /// Append up to remaining() bytes of data, returns the number of bytes taken.
  std::size_t accumulate(std::span<const std::byte> data);

  uint32_t type{};
  uint32_t declaredLength{};
  uint32_t bytesAccumulated{};
  RawBytes buffer;
};

/// Extracts complete parts from a contiguous byte buffer.
///
/// The framer is stateless: it never looks at bytes before the given buffer, and it reports how
/// far it got so that the caller can retain incomplete header bytes or the opened partial part.
class PartFramer {
 public:
  enum class Status : uint8_t {
    Exhausted,         ///< All bytes consumed, buffer ended on a part boundary
    NeedMoreData,      ///< Bytes after 'consumed' are a part header without any payload byte yet
    PartialOpen,       ///< All bytes consumed, the last part is incomplete and stored as PartialState
    InvalidVarInt,     ///< Malformed header at 'consumed'
    PartSizeOverflow,  ///< Header at 'consumed' declares a length above the maximum part size
  };

  struct Result {
    [[nodiscard]] bool isError() const noexcept {
      return status == Status::InvalidVarInt || status == Status::PartSizeOverflow;
    }

    Status status;
    std::size_t consumed;
  };

  explicit PartFramer(uint32_t maxPartSize) noexcept : _maxPartSize(maxPartSize) {}

  /// Frame parts from data, appending complete ones to 'out' in stream order.
  /// 'partial' must be empty on entry, it is set when the last part is incomplete.
  Result frame(std::span<const std::byte> data, vector<Part>& out, std::optional<PartialState>& partial) const;

  [[nodiscard]] uint32_t maxPartSize() const noexcept { return _maxPartSize; }

 private:
  uint32_t _maxPartSize;
};

}  // namespace ump
