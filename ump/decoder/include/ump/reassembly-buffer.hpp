#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>

#include "ump/decode-status.hpp"
#include "ump/decoder-config.hpp"
#include "ump/decoder-stats.hpp"
#include "ump/diagnostic.hpp"
#include "ump/part-framer.hpp"
#include "ump/part.hpp"
#include "ump/raw-bytes.hpp"
#include "ump/vector.hpp"

namespace ump {

/// Cross-chunk state of a UMP stream.
///
/// Holds the bytes of the previous chunks that could not be interpreted yet (an incomplete part
/// header, or an incomplete continuation wrapper) and at most one partially received part.
/// Each new chunk is appended to the retained bytes, the open partial part is resumed according
/// to the configured continuation framing, then the rest is handed to a PartFramer.
///
/// Thread safety: NOT thread-safe. One instance per stream.
class ReassemblyBuffer {
 public:
  explicit ReassemblyBuffer(const DecoderConfig& config) noexcept;

  /// Consume a new chunk, appending the parts it completes to 'out' in stream order.
  /// Parts completed before an error are still appended.
  [[nodiscard]] DecodeResult consumeChunk(std::span<const std::byte> chunk, vector<Part>& out);

  /// Whether a part payload is currently split across chunks.
  [[nodiscard]] bool hasPartial() const noexcept { return _partial.has_value(); }

  /// The open partial part, or nullptr.
  [[nodiscard]] const PartialState* partial() const noexcept { return _partial ? &*_partial : nullptr; }

  /// Bytes retained from previous chunks that are not yet interpreted.
  [[nodiscard]] std::size_t leftoverSize() const noexcept { return _leftover.size(); }

  /// Offset, in the whole stream, of the first byte not consumed yet.
  [[nodiscard]] uint64_t streamOffset() const noexcept { return _streamOffset; }

  [[nodiscard]] const DecoderStats& stats() const noexcept { return _stats; }

  void setDiagnosticCallback(DiagnosticCallback callback) { _onDiagnostic = std::move(callback); }

  /// Drop all retained state and release its memory.
  void clear() noexcept;

 private:
  DecodeResult resumePartial(std::span<const std::byte> data, std::size_t& pos, vector<Part>& out);
  DecodeResult resumeWrapped(std::span<const std::byte> data, std::size_t& pos, vector<Part>& out);

  void emitPartial(vector<Part>& out);

  void report(Diagnostic::Kind kind, const PartHeader& continuation, uint64_t streamOffset);

  DecoderConfig _config;
  PartFramer _framer;
  RawBytes _leftover;
  std::optional<PartialState> _partial;
  uint64_t _streamOffset{0};
  DecoderStats _stats;
  DiagnosticCallback _onDiagnostic;
};

}  // namespace ump
