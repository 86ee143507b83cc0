#include "ump/reassembly-buffer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "log.hpp"
#include "ump/decode-status.hpp"
#include "ump/decoder-config.hpp"
#include "ump/diagnostic.hpp"
#include "ump/part-framer.hpp"
#include "ump/part.hpp"
#include "ump/ump-protocol.hpp"
#include "ump/varint.hpp"
#include "ump/vector.hpp"

namespace ump {

namespace {

constexpr DecodeResult kOk{};

DecodeResult ToDecodeResult(PartFramer::Status status) noexcept {
  switch (status) {
    case PartFramer::Status::InvalidVarInt:
      return {DecodeStatus::InvalidVarInt, "Invalid varint in part header"};
    case PartFramer::Status::PartSizeOverflow:
      return {DecodeStatus::PartSizeOverflow, "Part length exceeds maximum part size"};
    default:
      return kOk;
  }
}

}  // namespace

ReassemblyBuffer::ReassemblyBuffer(const DecoderConfig& config) noexcept
    : _config(config), _framer(config.maxPartSize) {}

DecodeResult ReassemblyBuffer::consumeChunk(std::span<const std::byte> chunk, vector<Part>& out) {
  ++_stats.chunksFed;
  _stats.bytesFed += chunk.size();

  // Bytes retained from the previous chunks come first.
  const bool useLeftover = !_leftover.empty();
  std::span<const std::byte> data = chunk;
  if (useLeftover) {
    _leftover.append(chunk);
    data = _leftover.view();
  }

  const auto nbPartsBefore = out.size();
  std::size_t pos = 0;
  DecodeResult res = kOk;

  if (_partial) {
    res = resumePartial(data, pos, out);
  }

  if (res.isSuccess() && !_partial && pos < data.size()) {
    const auto framed = _framer.frame(data.subspan(pos), out, _partial);
    pos += framed.consumed;
    if (framed.isError()) {
      res = ToDecodeResult(framed.status);
    } else if (framed.status == PartFramer::Status::PartialOpen) {
      ++_stats.partialPartsOpened;
      log::debug("UMP part {} ({}) split across chunks: {}/{} bytes received", _partial->type,
                 PartTypeName(_partial->type).value_or("UNKNOWN"), _partial->bytesAccumulated,
                 _partial->declaredLength);
    }
  }

  for (auto idx = nbPartsBefore; idx < out.size(); ++idx) {
    ++_stats.partsEmitted;
    _stats.payloadBytesEmitted += out[idx].size();
    _stats.largestPartSize = std::max(_stats.largestPartSize, out[idx].size());
  }

  // Retain what could not be interpreted yet.
  if (useLeftover) {
    _leftover.erase_front(pos);
  } else {
    _leftover.assign(data.subspan(pos));
  }
  _streamOffset += pos;

  return res;
}

DecodeResult ReassemblyBuffer::resumePartial(std::span<const std::byte> data, std::size_t& pos,
                                             vector<Part>& out) {
  if (_config.continuationFraming == DecoderConfig::ContinuationFraming::Wrapped) {
    return resumeWrapped(data, pos, out);
  }

  pos += _partial->accumulate(data.subspan(pos));
  if (_partial->complete()) {
    emitPartial(out);
  }
  return kOk;
}

DecodeResult ReassemblyBuffer::resumeWrapped(std::span<const std::byte> data, std::size_t& pos,
                                             vector<Part>& out) {
  // A continuation is consumed only once its wrapper part, its header and, unless it is empty, at
  // least one of its bytes are available: incomplete prefixes stay in the leftover region.
  // Each continuation takes at most its own declared length, several may follow in one chunk.
  const bool lenient = _config.mismatchPolicy == DecoderConfig::MismatchPolicy::Lenient;

  while (_partial && pos < data.size()) {
    const auto rest = data.subspan(pos);

    PartHeader lead{};
    switch (ParsePartHeader(rest, lead)) {
      case VarInt::Status::Ok:
        break;
      case VarInt::Status::BufferUnderrun:
        return kOk;
      default:
        return {DecodeStatus::InvalidVarInt, "Invalid varint in continuation wrapper header"};
    }

    const bool hasWrapper = lead.type == kContinuationWrapperType;

    std::size_t continuationOffset = 0;
    PartHeader continuation = lead;
    if (hasWrapper) {
      if (lead.length > _config.maxPartSize) [[unlikely]] {
        return {DecodeStatus::PartSizeOverflow, "Continuation wrapper length exceeds maximum part size"};
      }
      if (rest.size() - lead.size < lead.length) {
        return kOk;
      }
      continuationOffset = lead.size + lead.length;
      switch (ParsePartHeader(rest.subspan(continuationOffset), continuation)) {
        case VarInt::Status::Ok:
          break;
        case VarInt::Status::BufferUnderrun:
          return kOk;
        default:
          return {DecodeStatus::InvalidVarInt, "Invalid varint in continuation header"};
      }
    } else if (!lenient) {
      return {DecodeStatus::PartialTypeMismatch, "Continuation chunk does not start with a wrapper part"};
    }

    const bool typeMismatch = continuation.type != _partial->type;
    if (typeMismatch && !lenient) {
      return {DecodeStatus::PartialTypeMismatch, "Continuation part type differs from the open partial part"};
    }

    const std::size_t payloadOffset = continuationOffset + continuation.size;
    if (rest.size() == payloadOffset && continuation.length != 0) {
      return kOk;
    }

    const uint64_t continuationStreamOffset = _streamOffset + pos + continuationOffset;

    if (typeMismatch) {
      ++_stats.typeMismatchesAccepted;
      log::warn("UMP continuation of type {} accepted for open part of type {} at offset {}", continuation.type,
                _partial->type, continuationStreamOffset);
      report(Diagnostic::Kind::TypeMismatchAccepted, continuation, continuationStreamOffset);
    }
    if (!hasWrapper) {
      log::warn("UMP continuation without wrapper part accepted at offset {}", continuationStreamOffset);
      report(Diagnostic::Kind::MissingContinuationWrapper, continuation, continuationStreamOffset);
    }

    // The length declared by the open part governs completion.
    if (continuation.length > _partial->remaining()) {
      ++_stats.oversizedContinuationLengths;
      log::warn("UMP continuation declares {} bytes but part {} only misses {}", continuation.length,
                _partial->type, _partial->remaining());
      report(Diagnostic::Kind::OversizedContinuationLength, continuation, continuationStreamOffset);
    }

    if (hasWrapper) {
      if (_config.surfaceContinuationWrappers) {
        out.push_back(Part{lead.type, RawBytes(rest.subspan(lead.size, lead.length))});
      } else {
        ++_stats.continuationWrappersSkipped;
        log::debug("UMP skipped continuation wrapper of {} bytes", lead.length);
      }
    }

    pos += payloadOffset;
    const auto available = data.subspan(pos);
    pos += _partial->accumulate(available.first(std::min<std::size_t>(continuation.length, available.size())));
    if (_partial->complete()) {
      emitPartial(out);
    }
  }
  return kOk;
}

void ReassemblyBuffer::emitPartial(vector<Part>& out) {
  log::debug("UMP part {} ({}) reassembled: {} bytes", _partial->type,
             PartTypeName(_partial->type).value_or("UNKNOWN"), _partial->declaredLength);
  out.push_back(Part{_partial->type, std::move(_partial->buffer)});
  _partial.reset();
}

void ReassemblyBuffer::report(Diagnostic::Kind kind, const PartHeader& continuation, uint64_t streamOffset) {
  if (_onDiagnostic) {
    _onDiagnostic(Diagnostic{kind, _partial->type, continuation.type, continuation.length, _partial->remaining(),
                             streamOffset});
  }
}

void ReassemblyBuffer::clear() noexcept {
  _leftover.release();
  _partial.reset();
}

}  // namespace ump
