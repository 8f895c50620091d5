#pragma once

// Logging goes through spdlog's default logger.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace framed {

namespace log = spdlog;

}  // namespace framed
