#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace tracker
{
    constexpr const char* default_database = "gametime.db";
    constexpr int default_snapshot_interval_seconds = 300;
    constexpr std::size_t default_max_concurrent_merges = 8;

    struct TrackerConfig
    {
        std::filesystem::path database{default_database};
        int snapshotIntervalSeconds{default_snapshot_interval_seconds};
        std::size_t maxConcurrentMerges{default_max_concurrent_merges};
        std::filesystem::path activitiesFile;
        bool requireKnownActivities{false};
        spdlog::level::level_enum logLevel{spdlog::level::info};
        std::filesystem::path logFile;
    };

    // Applies recognised keys from json on top of config. Values of the wrong
    // type or out of range are logged and left at their previous setting.
    void apply_config_json(TrackerConfig& config, const nlohmann::json& json);

    // Throws std::runtime_error when the file is missing or not valid JSON.
    void apply_config_file(TrackerConfig& config, const std::filesystem::path& path);

    // PLAYTIME_DB, PLAYTIME_SNAPSHOT_SECONDS, PLAYTIME_LOG_LEVEL
    void apply_environment(TrackerConfig& config);

    [[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& value);
}
