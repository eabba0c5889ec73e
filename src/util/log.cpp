#include "log.hpp"

#include <docsync-cpp/error.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <string>

namespace docsync_cpp::util {

namespace {

constexpr auto level_names = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(logger_name)) return existing;
    auto created = spdlog::stderr_color_mt(logger_name);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

}  // namespace

auto logger() -> const std::shared_ptr<spdlog::logger>& {
    static const auto instance = make_logger();
    return instance;
}

auto is_valid_log_level(std::string_view level) -> bool {
    for (auto name : level_names) {
        if (name == level) return true;
    }
    return false;
}

void set_log_level(std::string_view level) {
    if (!is_valid_log_level(level)) {
        throw Exception{ErrorCode::invalid_argument, "unknown log level: " + std::string{level}};
    }
    logger()->set_level(spdlog::level::from_str(std::string{level}));
}

}  // namespace docsync_cpp::util
