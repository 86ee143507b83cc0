#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "ump/decode-status.hpp"
#include "ump/decoder-config.hpp"
#include "ump/decoder-stats.hpp"
#include "ump/diagnostic.hpp"
#include "ump/part.hpp"
#include "ump/reassembly-buffer.hpp"
#include "ump/ump-protocol.hpp"
#include "ump/vector.hpp"

namespace ump {

/// Streaming decoder of a UMP response body.
///
/// Create one decoder per HTTP response, feed() it the body chunks in arrival order, and call
/// finish() once the transport reports the end of the body. Completed parts are returned in the
/// order of their bytes in the stream, whatever the chunk boundaries.
///
/// Any error is terminal: the decoder releases its buffers and every later call returns the same
/// error without looking at its input.
///
/// Thread safety: NOT thread-safe. Independent decoders share no state.
class PartDecoder {
 public:
  /// @throws std::invalid_argument if the configuration is invalid
  explicit PartDecoder(const DecoderConfig& config = {});

  /// Decode a new chunk of the stream.
  /// Parts completed by this chunk are appended to 'out'.
  [[nodiscard]] DecodeResult feed(std::span<const std::byte> chunk, vector<Part>& out);

  [[nodiscard]] DecodeResult feed(std::string_view chunk, vector<Part>& out) {
    return feed(std::as_bytes(std::span<const char>(chunk)), out);
  }

  /// Signal the end of the stream.
  /// Fails with DecodeStatus::TruncatedStream if a part header or payload is incomplete.
  [[nodiscard]] DecodeResult finish();

  /// Registered name of a part type, for diagnostics only.
  [[nodiscard]] static std::optional<std::string_view> partTypeName(uint32_t type) noexcept {
    return PartTypeName(type);
  }

  /// Receive non fatal protocol inconsistencies accepted by the lenient policy.
  void setDiagnosticCallback(DiagnosticCallback callback) { _buffer.setDiagnosticCallback(std::move(callback)); }

  [[nodiscard]] bool failed() const noexcept { return !_failure.isSuccess(); }

  [[nodiscard]] bool hasPartialPart() const noexcept { return _buffer.hasPartial(); }

  /// Bytes held by the decoder: retained header bytes and the payload of the open partial part.
  [[nodiscard]] std::size_t bufferedBytes() const noexcept;

  [[nodiscard]] const DecoderStats& stats() const noexcept { return _buffer.stats(); }

  [[nodiscard]] const DecoderConfig& config() const noexcept { return _config; }

 private:
  DecodeResult fail(DecodeResult res);

  DecoderConfig _config;
  ReassemblyBuffer _buffer;
  DecodeResult _failure;
};

}  // namespace ump
