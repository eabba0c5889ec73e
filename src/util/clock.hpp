#pragma once

// Wall-clock time as a SnapshotVersion (local write times, overlay
// application).
// Internal header — not installed.

#include <docsync-cpp/types.hpp>

#include <chrono>

namespace docsync_cpp::util {

inline auto now() -> SnapshotVersion {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return SnapshotVersion{std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count()};
}

}  // namespace docsync_cpp::util
