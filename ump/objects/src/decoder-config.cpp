#include "ump/decoder-config.hpp"

#include <stdexcept>

namespace ump {

void DecoderConfig::validate() const {
  if (maxPartSize == 0) {
    throw std::invalid_argument("DecoderConfig: maxPartSize must be greater than 0");
  }

  if (mismatchPolicy != MismatchPolicy::Strict && mismatchPolicy != MismatchPolicy::Lenient) {
    throw std::invalid_argument("DecoderConfig: unknown mismatchPolicy");
  }

  if (continuationFraming != ContinuationFraming::Wrapped &&
      continuationFraming != ContinuationFraming::Contiguous) {
    throw std::invalid_argument("DecoderConfig: unknown continuationFraming");
  }

  // Wrappers only exist in wrapped framing
  if (surfaceContinuationWrappers && continuationFraming != ContinuationFraming::Wrapped) {
    throw std::invalid_argument("DecoderConfig: surfaceContinuationWrappers requires Wrapped continuation framing");
  }
}

}  // namespace ump
