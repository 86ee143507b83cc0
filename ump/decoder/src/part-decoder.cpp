#include "ump/part-decoder.hpp"

#include <cstddef>
#include <span>

#include "log.hpp"
#include "ump/decode-status.hpp"
#include "ump/decoder-config.hpp"
#include "ump/part.hpp"
#include "ump/vector.hpp"

namespace ump {

namespace {

const DecoderConfig& Validated(const DecoderConfig& config) {
  config.validate();
  return config;
}

}  // namespace

PartDecoder::PartDecoder(const DecoderConfig& config) : _config(Validated(config)), _buffer(_config) {}

DecodeResult PartDecoder::feed(std::span<const std::byte> chunk, vector<Part>& out) {
  if (failed()) [[unlikely]] {
    return _failure;
  }
  if (chunk.empty()) {
    return {};
  }

  const DecodeResult res = _buffer.consumeChunk(chunk, out);
  if (!res.isSuccess()) {
    return fail(res);
  }
  return res;
}

DecodeResult PartDecoder::finish() {
  if (failed()) [[unlikely]] {
    return _failure;
  }
  if (_buffer.hasPartial()) {
    return fail({DecodeStatus::TruncatedStream, "Stream ended inside a part payload"});
  }
  if (_buffer.leftoverSize() != 0) {
    return fail({DecodeStatus::TruncatedStream, "Stream ended inside a part header"});
  }
  return {};
}

std::size_t PartDecoder::bufferedBytes() const noexcept {
  const auto* partial = _buffer.partial();
  return _buffer.leftoverSize() + (partial == nullptr ? 0 : partial->buffer.size());
}

DecodeResult PartDecoder::fail(DecodeResult res) {
  log::error("UMP decoding failed at offset {}: {} ({})", _buffer.streamOffset(), res.errorMessage,
             DecodeStatusName(res.status));
  _failure = res;
  _buffer.clear();
  return res;
}

}  // namespace ump
