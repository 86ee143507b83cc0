#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "ump/raw-bytes.hpp"
#include "ump/vector.hpp"

namespace ump::test {

// Append the encoding of 'value' on exactly 'size' bytes (1 to 5).
// Throws std::invalid_argument if value does not fit.
void AppendVarInt(RawBytes& out, uint32_t value, uint8_t size);

// Append the shortest encoding of 'value'.
void AppendVarInt(RawBytes& out, uint32_t value);

// Deterministic payload of 'size' bytes, different for each seed.
RawBytes MakePayload(std::size_t size, uint8_t seed = 0);

inline std::span<const std::byte> AsBytes(std::string_view str) { return std::as_bytes(std::span<const char>(str)); }

// Builds UMP byte streams for tests and benchmarks.
class UmpStreamBuilder {
 public:
  // Complete part with a minimally encoded header.
  UmpStreamBuilder& part(uint32_t type, std::span<const std::byte> payload);

  UmpStreamBuilder& part(uint32_t type, std::string_view payload) { return part(type, AsBytes(payload)); }

  // Part header only, with explicit encoded sizes for each varint (0 means shortest).
  UmpStreamBuilder& header(uint32_t type, uint32_t length, uint8_t typeSize = 0, uint8_t lengthSize = 0);

  UmpStreamBuilder& raw(std::span<const std::byte> bytes);

  UmpStreamBuilder& raw(std::string_view bytes) { return raw(AsBytes(bytes)); }

  [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return _buf.view(); }

  [[nodiscard]] std::size_t size() const noexcept { return _buf.size(); }

  // Split the stream at the given ascending offsets.
  [[nodiscard]] vector<RawBytes> split(std::span<const std::size_t> offsets) const;

  RawBytes release() noexcept;

 private:
  RawBytes _buf;
};

}  // namespace ump::test
