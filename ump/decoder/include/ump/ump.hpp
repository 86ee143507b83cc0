// ump Umbrella Header
//
// Include this single header to pull in the public UMP decoding API:
//   - PartDecoder, the streaming decoder of a UMP response body
//   - DecoderConfig, DecodeResult / DecodeStatus, Diagnostic, DecoderStats
//   - Part and the part type registry (PartType, PartTypeName, KnownPartTypes)
//
// The lower level building blocks (DecodeVarInt, PartFramer, ReassemblyBuffer) are not
// re-exported, include their headers directly if needed.
//
// Usage Example:
//    #include <ump/ump.hpp>
//    ump::PartDecoder decoder;
//    ump::vector<ump::Part> parts;
//    for (std::string_view chunk : body) {
//      if (!decoder.feed(chunk, parts).isSuccess()) { /* abandon the stream */ }
//    }
//    if (!decoder.finish().isSuccess()) { /* truncated transfer */ }
#pragma once

#include "ump/decode-status.hpp"    // IWYU pragma: export
#include "ump/decoder-config.hpp"   // IWYU pragma: export
#include "ump/decoder-stats.hpp"    // IWYU pragma: export
#include "ump/diagnostic.hpp"       // IWYU pragma: export
#include "ump/part-decoder.hpp"     // IWYU pragma: export
#include "ump/part.hpp"             // IWYU pragma: export
#include "ump/ump-protocol.hpp"     // IWYU pragma: export
#include "ump/vector.hpp"           // IWYU pragma: export
