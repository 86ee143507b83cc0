#include "ump/part-framer.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ump/part.hpp"
#include "ump/raw-bytes.hpp"
#include "ump/varint.hpp"
#include "ump/vector.hpp"

namespace ump {

VarInt::Status ParsePartHeader(std::span<const std::byte> data, PartHeader& out) noexcept {
  const VarInt type = DecodeVarInt(data);
  if (!type.ok()) {
    return type.status;
  }
  const VarInt length = DecodeVarInt(data.subspan(type.size));
  if (!length.ok()) {
    return length.status;
  }

  out.type = type.value;
  out.length = length.value;
  out.size = static_cast<uint8_t>(type.size + length.size);
  return VarInt::Status::Ok;
}

std::size_t PartialState::accumulate(std::span<const std::byte> data) {
  const std::size_t taken = std::min<std::size_t>(remaining(), data.size());
  buffer.append(data.first(taken));
  bytesAccumulated += static_cast<uint32_t>(taken);
  return taken;
}

PartFramer::Result PartFramer::frame(std::span<const std::byte> data, vector<Part>& out,
                                     std::optional<PartialState>& partial) const {
  assert(!partial);

  std::size_t pos = 0;
  while (pos < data.size()) {
    PartHeader header{};
    switch (ParsePartHeader(data.subspan(pos), header)) {
      case VarInt::Status::Ok:
        break;
      case VarInt::Status::BufferUnderrun:
        return {Status::NeedMoreData, pos};
      default:
        return {Status::InvalidVarInt, pos};
    }

    if (header.length > _maxPartSize) [[unlikely]] {
      return {Status::PartSizeOverflow, pos};
    }

    const auto payload = data.subspan(pos + header.size);
    if (header.length != 0 && payload.empty()) {
      return {Status::NeedMoreData, pos};
    }
    if (payload.size() < header.length) {
      // Keep what we have, the rest of the payload comes with the next chunks.
      auto& state = partial.emplace();
      state.type = header.type;
      state.declaredLength = header.length;
      state.buffer.reserve(header.length);
      state.accumulate(payload);
      return {Status::PartialOpen, data.size()};
    }

    out.push_back(Part{header.type, RawBytes(payload.first(header.length))});
    pos += header.size + header.length;
  }

  return {Status::Exhausted, pos};
}

}  // namespace ump
