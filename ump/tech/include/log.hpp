#pragma once

// Logging facade over spdlog. Call sites use ump::log::{debug,info,warn,error}.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace ump {

namespace log = spdlog;

}  // namespace ump
