/// @file settings.hpp
/// @brief Client configuration, loadable from JSON.
///
/// @code
/// {
///   "project_id": "demo",
///   "persistence_enabled": true,
///   "data_directory": "/var/lib/app/docsync",
///   "cache_size_bytes": 104857600,
///   "log_level": "info"
/// }
/// @endcode

#pragma once

#include <docsync-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace docsync_cpp {

struct Settings {
    /// Disables LRU garbage collection.
    static constexpr std::int64_t cache_size_unlimited = -1;
    static constexpr std::int64_t default_cache_size_bytes = 100 * 1024 * 1024;
    static constexpr std::int64_t minimum_cache_size_bytes = 1 * 1024 * 1024;

    std::string project_id;
    std::string database_id{"(default)"};
    std::string host{"localhost:8080"};
    bool ssl_enabled{true};

    /// Durable persistence in `data_directory`; memory persistence if false.
    bool persistence_enabled{true};
    std::filesystem::path data_directory{"docsync-data"};

    std::int64_t cache_size_bytes{default_cache_size_bytes};
    std::int32_t max_concurrent_limbo_resolutions{100};

    /// Let the query engine create cache indexes for slow queries.
    bool automatic_index_creation{false};

    /// One of trace, debug, info, warn, error, critical, off.
    std::string log_level{"warn"};

    auto database() const -> DatabaseId { return DatabaseId{project_id, database_id}; }

    /// Throws Exception (invalid_argument) describing the first bad field.
    void validate() const;

    auto operator==(const Settings&) const -> bool = default;
};

void to_json(nlohmann::json& j, const Settings& settings);

/// Missing keys keep their defaults. Throws Exception (invalid_argument)
/// on wrongly typed or invalid values.
void from_json(const nlohmann::json& j, Settings& settings);

/// Read settings from a JSON file. Throws Exception (not_found) if the
/// file cannot be opened, invalid_argument if it does not parse.
auto load_settings(const std::filesystem::path& path) -> Settings;

}  // namespace docsync_cpp
