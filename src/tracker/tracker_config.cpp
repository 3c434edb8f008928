#include "tracker_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace tracker
{
    namespace
    {
        std::string read_env_var(const char* name)
        {
            const char* value = std::getenv(name);
            return value == nullptr ? std::string{} : std::string{value};
        }

        std::optional<std::int64_t> parse_int(const std::string& value)
        {
            try
            {
                std::size_t consumed = 0;
                const std::int64_t parsed = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    return std::nullopt;
                }
                return parsed;
            }
            catch (const std::exception&)
            {
                return std::nullopt;
            }
        }

        void apply_snapshot_interval(TrackerConfig& config, std::int64_t seconds, const char* source)
        {
            if (seconds < 0)
            {
                spdlog::warn("{} snapshot interval {} is negative; keeping {}s", source, seconds, config.snapshotIntervalSeconds);
                return;
            }
            if (seconds > std::numeric_limits<int>::max())
            {
                spdlog::warn("{} snapshot interval {} is too large; keeping {}s", source, seconds, config.snapshotIntervalSeconds);
                return;
            }
            config.snapshotIntervalSeconds = static_cast<int>(seconds);
        }
    }

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string& value)
    {
        const auto level = spdlog::level::from_str(value);
        // from_str maps anything unrecognised to off; only accept it when asked for.
        if (level == spdlog::level::off && value != "off")
        {
            return std::nullopt;
        }
        return level;
    }

    void apply_config_json(TrackerConfig& config, const nlohmann::json& json)
    {
        if (!json.is_object())
        {
            throw std::invalid_argument("configuration must be a JSON object");
        }

        if (json.contains("database"))
        {
            const auto& value = json.at("database");
            if (value.is_string() && !value.get<std::string>().empty())
            {
                config.database = value.get<std::string>();
            }
            else
            {
                spdlog::warn("config: database must be a non-empty string; keeping {}", config.database.string());
            }
        }

        if (json.contains("snapshot_interval_seconds"))
        {
            const auto& value = json.at("snapshot_interval_seconds");
            if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            {
                spdlog::warn("config: snapshot_interval_seconds {} is too large; keeping {}s",
                    value.get<std::uint64_t>(), config.snapshotIntervalSeconds);
            }
            else if (value.is_number_integer())
            {
                apply_snapshot_interval(config, value.get<std::int64_t>(), "config:");
            }
            else
            {
                spdlog::warn("config: snapshot_interval_seconds must be an integer");
            }
        }

        if (json.contains("max_concurrent_merges"))
        {
            const auto& value = json.at("max_concurrent_merges");
            if (value.is_number_integer() && value.get<std::int64_t>() > 0)
            {
                config.maxConcurrentMerges = value.get<std::size_t>();
            }
            else
            {
                spdlog::warn("config: max_concurrent_merges must be a positive integer; keeping {}", config.maxConcurrentMerges);
            }
        }

        if (json.contains("activities_file"))
        {
            const auto& value = json.at("activities_file");
            if (value.is_string())
            {
                config.activitiesFile = value.get<std::string>();
            }
            else
            {
                spdlog::warn("config: activities_file must be a string");
            }
        }

        if (json.contains("require_known_activities"))
        {
            const auto& value = json.at("require_known_activities");
            if (value.is_boolean())
            {
                config.requireKnownActivities = value.get<bool>();
            }
            else
            {
                spdlog::warn("config: require_known_activities must be a boolean");
            }
        }

        if (json.contains("log_level"))
        {
            const auto& value = json.at("log_level");
            const auto level = value.is_string() ? parse_log_level(value.get<std::string>()) : std::nullopt;
            if (level)
            {
                config.logLevel = *level;
            }
            else
            {
                spdlog::warn("config: unrecognised log_level; keeping {}", spdlog::level::to_string_view(config.logLevel));
            }
        }

        if (json.contains("log_file"))
        {
            const auto& value = json.at("log_file");
            if (value.is_string())
            {
                config.logFile = value.get<std::string>();
            }
            else
            {
                spdlog::warn("config: log_file must be a string");
            }
        }
    }

    void apply_config_file(TrackerConfig& config, const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open configuration file: " + path.string());
        }

        const auto json = nlohmann::json::parse(file, nullptr, false);
        if (json.is_discarded())
        {
            throw std::runtime_error("Configuration file is not valid JSON: " + path.string());
        }

        apply_config_json(config, json);
        spdlog::info("Loaded configuration from {}", path.string());
    }

    void apply_environment(TrackerConfig& config)
    {
        if (const auto db = read_env_var("PLAYTIME_DB"); !db.empty())
        {
            config.database = db;
        }

        if (const auto interval = read_env_var("PLAYTIME_SNAPSHOT_SECONDS"); !interval.empty())
        {
            if (const auto seconds = parse_int(interval))
            {
                apply_snapshot_interval(config, *seconds, "PLAYTIME_SNAPSHOT_SECONDS");
            }
            else
            {
                spdlog::warn("PLAYTIME_SNAPSHOT_SECONDS value '{}' is not a number; using {}s", interval, config.snapshotIntervalSeconds);
            }
        }

        if (const auto level = read_env_var("PLAYTIME_LOG_LEVEL"); !level.empty())
        {
            if (const auto parsed = parse_log_level(level))
            {
                config.logLevel = *parsed;
            }
            else
            {
                spdlog::warn("PLAYTIME_LOG_LEVEL value '{}' is not a log level", level);
            }
        }
    }
}
