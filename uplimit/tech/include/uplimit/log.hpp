#pragma once

// Logging abstraction on top of spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace uplimit {

namespace log = spdlog;

}  // namespace uplimit
