#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace ump {

/// Non fatal protocol inconsistency accepted by the decoder.
struct Diagnostic {
  enum class Kind : uint8_t {
    /// Continuation type differs from the open partial part, bytes accepted (lenient policy).
    TypeMismatchAccepted,
    /// Continuation chunk without a leading wrapper part, bytes accepted (lenient policy).
    MissingContinuationWrapper,
    /// Continuation declares more bytes than the open partial part still expects.
    OversizedContinuationLength,
  };

  Kind kind;
  uint32_t expectedType;     ///< Type of the open partial part
  uint32_t actualType;       ///< Type read from the continuation header
  uint32_t declaredLength;   ///< Length read from the continuation header
  uint32_t remainingLength;  ///< Bytes still missing from the open partial part
  uint64_t streamOffset;     ///< Offset of the continuation header in the whole stream
};

constexpr std::string_view DiagnosticKindName(Diagnostic::Kind kind) noexcept {
  switch (kind) {
    case Diagnostic::Kind::TypeMismatchAccepted:
      return "TYPE_MISMATCH_ACCEPTED";
    case Diagnostic::Kind::MissingContinuationWrapper:
      return "MISSING_CONTINUATION_WRAPPER";
    case Diagnostic::Kind::OversizedContinuationLength:
      return "OVERSIZED_CONTINUATION_LENGTH";
    default:
      return "UNKNOWN";
  }
}

using DiagnosticCallback = std::function<void(const Diagnostic& diagnostic)>;

}  // namespace ump
