#pragma once

#include <amc/vector.hpp>  // IWYU pragma: export

namespace ump {

// Default contiguous container of the library.
// amc::vector relocates types declaring 'trivially_relocatable' with memcpy.
using amc::vector;

}  // namespace ump
