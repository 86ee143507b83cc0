#pragma once

#include <cstddef>
#include <cstdint>

namespace ump {

struct DecoderStats {
  // Introspection enumeration of all fields, in declaration order.
  template <class F>
  void for_each_field(F&& fun) const {
    fun("chunksFed", chunksFed);
    fun("bytesFed", bytesFed);
    fun("partsEmitted", partsEmitted);
    fun("payloadBytesEmitted", payloadBytesEmitted);
    fun("partialPartsOpened", partialPartsOpened);
    fun("continuationWrappersSkipped", continuationWrappersSkipped);
    fun("typeMismatchesAccepted", typeMismatchesAccepted);
    fun("oversizedContinuationLengths", oversizedContinuationLengths);
    fun("largestPartSize", static_cast<uint64_t>(largestPartSize));
  }

  uint64_t chunksFed{};
  uint64_t bytesFed{};
  uint64_t partsEmitted{};
  uint64_t payloadBytesEmitted{};
  uint64_t partialPartsOpened{};
  uint64_t continuationWrappersSkipped{};
  uint64_t typeMismatchesAccepted{};
  uint64_t oversizedContinuationLengths{};
  std::size_t largestPartSize{};
};

}  // namespace ump
