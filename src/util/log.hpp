#pragma once

// The library's spdlog logger.
//
// All components log through one named logger ("docsync") writing to a
// coloured stderr sink. Protocol decisions log at debug, recoverable
// failures at warn, invariant violations at critical.
//
// Internal header — not installed.

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace docsync_cpp::util {

inline constexpr auto logger_name = "docsync";

// The shared logger. Created on first use; reuses a logger registered
// under the same name by the application.
auto logger() -> const std::shared_ptr<spdlog::logger>&;

// Set the level from its name (trace, debug, info, warn, error, critical,
// off). Throws Exception (invalid_argument) for unknown names.
void set_log_level(std::string_view level);

// True if `level` names a spdlog level.
auto is_valid_log_level(std::string_view level) -> bool;

}  // namespace docsync_cpp::util
