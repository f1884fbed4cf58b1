#pragma once

// Logging facade: all waypoint code logs through waypoint::log, which is spdlog.
// Ensure header-only usage is forced locally without exporting SPDLOG_HEADER_ONLY
// as a public compile definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace waypoint {

namespace log = spdlog;

}  // namespace waypoint
