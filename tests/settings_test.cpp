#include "test_util.hpp"

#include "../src/util/log.hpp"

#include <docsync-cpp/settings.hpp>

#include <gtest/gtest.h>

#include <fstream>

using namespace docsync_cpp;
using namespace docsync_cpp::test;

namespace {

void expect_invalid(const nlohmann::json& j) {
    try {
        (void)j.get<Settings>();
        ADD_FAILURE() << "accepted " << j.dump();
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::invalid_argument) << j.dump();
    }
}

void write_file(const std::filesystem::path& path, std::string_view contents) {
    auto out = std::ofstream{path};
    out << contents;
}

}  // namespace

TEST(Settings, defaults_are_valid) {
    auto settings = Settings{};
    settings.project_id = "demo";
    EXPECT_NO_THROW(settings.validate());
    EXPECT_EQ(settings.database(), (DatabaseId{"demo", "(default)"}));
    EXPECT_EQ(settings.cache_size_bytes, Settings::default_cache_size_bytes);
    EXPECT_TRUE(settings.persistence_enabled);
}

TEST(Settings, missing_keys_keep_their_defaults) {
    auto settings = nlohmann::json{{"project_id", "demo"}, {"persistence_enabled", false}}.get<Settings>();
    EXPECT_EQ(settings.project_id, "demo");
    EXPECT_FALSE(settings.persistence_enabled);
    EXPECT_EQ(settings.database_id, "(default)");
    EXPECT_EQ(settings.log_level, "warn");
    EXPECT_EQ(settings.max_concurrent_limbo_resolutions, 100);
    EXPECT_EQ(settings.host, "localhost:8080");
}

TEST(Settings, json_round_trip) {
    auto settings = Settings{};
    settings.project_id = "demo";
    settings.database_id = "staging";
    settings.data_directory = "/var/lib/docsync";
    settings.cache_size_bytes = Settings::cache_size_unlimited;
    settings.automatic_index_creation = true;
    settings.log_level = "debug";

    auto j = nlohmann::json(settings);
    EXPECT_EQ(j["data_directory"], "/var/lib/docsync");
    EXPECT_EQ(j.get<Settings>(), settings);
}

TEST(Settings, rejects_invalid_values) {
    expect_invalid(nlohmann::json::array());
    expect_invalid({{"cache_size_bytes", "large"}});
    expect_invalid({{"cache_size_bytes", 1024}});
    expect_invalid({{"max_concurrent_limbo_resolutions", 0}});
    expect_invalid({{"database_id", ""}});
    expect_invalid({{"host", ""}});
    expect_invalid({{"log_level", "verbose"}});
    expect_invalid({{"persistence_enabled", true}, {"data_directory", ""}});
}

TEST(Settings, memory_persistence_needs_no_directory) {
    auto settings = nlohmann::json{{"persistence_enabled", false}, {"data_directory", ""}}.get<Settings>();
    EXPECT_FALSE(settings.persistence_enabled);
}

TEST(Settings, load_from_file) {
    auto dir = TempDir{};
    auto path = dir.path() / "docsync.json";
    write_file(path, R"({"project_id": "demo", "cache_size_bytes": 2097152, "log_level": "info"})");

    auto settings = load_settings(path);
    EXPECT_EQ(settings.project_id, "demo");
    EXPECT_EQ(settings.cache_size_bytes, 2097152);
    EXPECT_EQ(settings.log_level, "info");
}

TEST(Settings, load_reports_missing_and_malformed_files) {
    auto dir = TempDir{};
    try {
        load_settings(dir.path() / "absent.json");
        ADD_FAILURE() << "loaded a missing file";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::not_found);
    }

    auto path = dir.path() / "broken.json";
    write_file(path, "{\"project_id\": ");
    try {
        load_settings(path);
        ADD_FAILURE() << "loaded a malformed file";
    } catch (const Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::invalid_argument);
    }
}

TEST(LogLevel, names_are_validated) {
    EXPECT_TRUE(util::is_valid_log_level("trace"));
    EXPECT_TRUE(util::is_valid_log_level("off"));
    EXPECT_FALSE(util::is_valid_log_level("loud"));
    EXPECT_THROW(util::set_log_level("loud"), Exception);

    util::set_log_level("error");
    EXPECT_EQ(util::logger()->level(), spdlog::level::err);
    util::set_log_level("warn");
}
