#pragma once

// Internal invariant checks.
//
// A failed check logs at critical level with the caller's location and
// throws InternalError. The engine never catches it. The message is only
// formatted on failure; the format string is checked at compile time.
//
// Internal header — not installed.

#include "log.hpp"

#include <docsync-cpp/error.hpp>

#include <fmt/format.h>

#include <source_location>
#include <string>
#include <type_traits>
#include <utility>

namespace docsync_cpp::util {

// A format string together with the place it was written.
template <typename... Args>
struct LocatedFormat {
    template <typename S>
    consteval LocatedFormat(const S& text, std::source_location where = std::source_location::current())
        : text{text}, where{where} {}

    fmt::format_string<Args...> text;
    std::source_location where;
};

[[noreturn]] inline void fail_assertion(const std::source_location& where, const std::string& message) {
    logger()->critical("ASSERTION FAILED at {}:{} in {}: {}", where.file_name(), where.line(),
                       where.function_name(), message);
    throw InternalError{message};
}

template <typename... Args>
[[noreturn]] void hard_fail(LocatedFormat<std::type_identity_t<Args>...> format, Args&&... args) {
    fail_assertion(format.where, fmt::format(format.text, std::forward<Args>(args)...));
}

template <typename... Args>
void hard_assert(bool condition, LocatedFormat<std::type_identity_t<Args>...> format, Args&&... args) {
    if (condition) return;
    fail_assertion(format.where, fmt::format(format.text, std::forward<Args>(args)...));
}

}  // namespace docsync_cpp::util
