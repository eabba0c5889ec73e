#include <docsync-cpp/settings.hpp>

#include <docsync-cpp/error.hpp>

#include "util/log.hpp"

#include <fstream>
#include <string>

namespace docsync_cpp {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* name, T& out) {
    auto it = j.find(name);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorCode::invalid_argument,
                        std::string{"settings field '"} + name + "' has the wrong type: " + e.what()};
    }
}

}  // namespace

void Settings::validate() const {
    if (database_id.empty()) {
        throw Exception{ErrorCode::invalid_argument, "settings: database_id must not be empty"};
    }
    if (host.empty()) {
        throw Exception{ErrorCode::invalid_argument, "settings: host must not be empty"};
    }
    if (cache_size_bytes != cache_size_unlimited && cache_size_bytes < minimum_cache_size_bytes) {
        throw Exception{ErrorCode::invalid_argument,
                        "settings: cache_size_bytes must be at least " + std::to_string(minimum_cache_size_bytes) +
                            " or cache_size_unlimited"};
    }
    if (max_concurrent_limbo_resolutions < 1) {
        throw Exception{ErrorCode::invalid_argument, "settings: max_concurrent_limbo_resolutions must be positive"};
    }
    if (persistence_enabled && data_directory.empty()) {
        throw Exception{ErrorCode::invalid_argument, "settings: data_directory is required with persistence"};
    }
    if (!util::is_valid_log_level(log_level)) {
        throw Exception{ErrorCode::invalid_argument, "settings: unknown log_level '" + log_level + "'"};
    }
}

void to_json(nlohmann::json& j, const Settings& settings) {
    j = nlohmann::json{
        {"project_id", settings.project_id},
        {"database_id", settings.database_id},
        {"host", settings.host},
        {"ssl_enabled", settings.ssl_enabled},
        {"persistence_enabled", settings.persistence_enabled},
        {"data_directory", settings.data_directory.string()},
        {"cache_size_bytes", settings.cache_size_bytes},
        {"max_concurrent_limbo_resolutions", settings.max_concurrent_limbo_resolutions},
        {"automatic_index_creation", settings.automatic_index_creation},
        {"log_level", settings.log_level},
    };
}

void from_json(const nlohmann::json& j, Settings& settings) {
    if (!j.is_object()) throw Exception{ErrorCode::invalid_argument, "settings must be a JSON object"};

    read_field(j, "project_id", settings.project_id);
    read_field(j, "database_id", settings.database_id);
    read_field(j, "host", settings.host);
    read_field(j, "ssl_enabled", settings.ssl_enabled);
    read_field(j, "persistence_enabled", settings.persistence_enabled);
    auto directory = settings.data_directory.string();
    read_field(j, "data_directory", directory);
    settings.data_directory = directory;
    read_field(j, "cache_size_bytes", settings.cache_size_bytes);
    read_field(j, "max_concurrent_limbo_resolutions", settings.max_concurrent_limbo_resolutions);
    read_field(j, "automatic_index_creation", settings.automatic_index_creation);
    read_field(j, "log_level", settings.log_level);

    settings.validate();
}

auto load_settings(const std::filesystem::path& path) -> Settings {
    auto in = std::ifstream{path};
    if (!in) throw Exception{ErrorCode::not_found, "cannot open settings file " + path.string()};

    auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw Exception{ErrorCode::invalid_argument, "settings file " + path.string() + " is not valid JSON"};
    }
    return j.get<Settings>();
}

}  // namespace docsync_cpp
