#pragma once

#include <cstdint>

namespace ump {

/// UMP decoder configuration.
///
/// Default values favor correctness: continuation parts are validated strictly
/// and no single part may exceed 64 MiB.
struct DecoderConfig {
  /// Handling of a continuation whose type differs from the open partial part.
  enum class MismatchPolicy : uint8_t {
    /// Fail the stream with DecodeStatus::PartialTypeMismatch.
    Strict,
    /// Report a Diagnostic, log a warning and accept the bytes as continuation data.
    Lenient,
  };

  /// How the payload of a part spanning several chunks continues in the next chunk.
  enum class ContinuationFraming : uint8_t {
    /// Each following chunk starts with a MEDIA_HEADER (20) wrapper part, then a continuation
    /// header carrying the type of the open part, then the continuation bytes.
    Wrapped,
    /// Chunk boundaries are transport artifacts: the payload continues with raw bytes.
    Contiguous,
  };

  static constexpr uint32_t kDefaultMaxPartSize = 64U * 1024U * 1024U;

  /// Largest accepted declared part length, in bytes. Must be greater than 0.
  /// Protects against unbounded allocations for corrupted or hostile length fields.
  /// Default: 64 MiB.
  uint32_t maxPartSize{kDefaultMaxPartSize};

  /// Default: Strict.
  MismatchPolicy mismatchPolicy{MismatchPolicy::Strict};

  /// Default: Wrapped.
  ContinuationFraming continuationFraming{ContinuationFraming::Wrapped};

  /// When true, continuation wrapper parts are emitted as regular parts instead of being skipped.
  /// Default: false.
  bool surfaceContinuationWrappers{false};

  // ============================
  // Builder-style setters
  // ============================

  DecoderConfig& withMaxPartSize(uint32_t size) {
    maxPartSize = size;
    return *this;
  }

  DecoderConfig& withMismatchPolicy(MismatchPolicy policy) {
    mismatchPolicy = policy;
    return *this;
  }

  DecoderConfig& withLenientMismatch() { return withMismatchPolicy(MismatchPolicy::Lenient); }

  DecoderConfig& withContinuationFraming(ContinuationFraming framing) {
    continuationFraming = framing;
    return *this;
  }

  DecoderConfig& withSurfaceContinuationWrappers(bool enable = true) {
    surfaceContinuationWrappers = enable;
    return *this;
  }

  /// Validate configuration values.
  /// @throws std::invalid_argument if any value is invalid
  void validate() const;

  bool operator==(const DecoderConfig&) const noexcept = default;
};

}  // namespace ump
