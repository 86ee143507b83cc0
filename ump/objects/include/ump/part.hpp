#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "ump/raw-bytes.hpp"

namespace ump {

/// A complete UMP part: its type id and its fully assembled payload.
/// The payload is opaque to the decoder (usually a protobuf message or media bytes).
struct Part {
  [[nodiscard]] std::size_t size() const noexcept { return payload.size(); }

  [[nodiscard]] bool empty() const noexcept { return payload.empty(); }

  bool operator==(const Part &) const noexcept = default;

  using trivially_relocatable = std::true_type;

  uint32_t type{};
  RawBytes payload;
};

}  // namespace ump
