#include "console_commands.hpp"
#include "tracker_config.hpp"
#include "tracker_runtime.hpp"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{
    constexpr char tracker_name[] = "playtime";
    constexpr int stdin_poll_ms = 100;

    enum class Mode
    {
        RunConsole,
        QueryTotals,
        ShowHelp
    };

    struct ProgramOptions
    {
        Mode mode{Mode::RunConsole};
        std::optional<std::filesystem::path> configFile;
        std::optional<std::filesystem::path> database;
        std::optional<std::filesystem::path> activitiesFile;
        std::optional<std::filesystem::path> logFile;
        std::string identity;
        std::string error;
    };

    std::atomic_bool& is_running()
    {
        static std::atomic_bool running{true};
        return running;
    }

    void termination_handler(int)
    {
        is_running() = false;
    }

    ProgramOptions parse_options(int argc, char** argv)
    {
        ProgramOptions options;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if (arg == "--help" || arg == "-h")
            {
                options.mode = Mode::ShowHelp;
                break;
            }
            if (arg == "--config" && hasValue)
            {
                options.configFile = argv[++i];
            }
            else if (arg == "--db" && hasValue)
            {
                options.database = argv[++i];
            }
            else if (arg == "--activities" && hasValue)
            {
                options.activitiesFile = argv[++i];
            }
            else if (arg == "--log-file" && hasValue)
            {
                options.logFile = argv[++i];
            }
            else if (arg == "--totals" && hasValue)
            {
                options.mode = Mode::QueryTotals;
                options.identity = argv[++i];
            }
            else
            {
                options.error = "Unrecognised or incomplete argument: " + arg;
                break;
            }
        }

        return options;
    }

    void print_usage()
    {
        std::cout << "Usage: " << tracker_name << " [--config FILE] [--db FILE] [--activities FILE]"
                  << " [--log-file FILE] [--totals IDENTITY]\n\n"
                  << "Without --totals, reads commands from stdin.\n\n"
                  << tracker::console_help();
    }

    void configure_logging(const tracker::TrackerConfig& config)
    {
        std::shared_ptr<spdlog::logger> logger;
        if (!config.logFile.empty())
        {
            try
            {
                logger = spdlog::basic_logger_mt("playtime-file", config.logFile.string());
            }
            catch (const spdlog::spdlog_ex& ex)
            {
                spdlog::error("Cannot log to {}: {}; staying on stdout", config.logFile.string(), ex.what());
            }
        }

        if (logger)
        {
            spdlog::set_default_logger(logger);
        }

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_level(config.logLevel);
        spdlog::flush_on(spdlog::level::warn);
    }

    bool load_config(const ProgramOptions& options, tracker::TrackerConfig& config)
    {
        if (options.configFile)
        {
            try
            {
                tracker::apply_config_file(config, *options.configFile);
            }
            catch (const std::exception& ex)
            {
                spdlog::error("{}", ex.what());
                return false;
            }
        }

        tracker::apply_environment(config);

        if (options.database)
        {
            config.database = *options.database;
        }
        if (options.activitiesFile)
        {
            config.activitiesFile = *options.activitiesFile;
        }
        if (options.logFile)
        {
            config.logFile = *options.logFile;
        }
        return true;
    }

    // Returns false once stdin is closed or "quit" was entered.
    bool pump_console(tracker::TrackerRuntime& runtime, std::string& pending)
    {
        pollfd fd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&fd, 1, stdin_poll_ms);
        if (ready < 0)
        {
            if (errno != EINTR)
            {
                spdlog::error("poll on stdin failed: {}", std::strerror(errno));
                return false;
            }
            return true;
        }
        if (ready == 0)
        {
            return true;
        }

        char buffer[512];
        const ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (count < 0)
        {
            return errno == EINTR;
        }
        if (count == 0)
        {
            spdlog::info("stdin closed");
            return false;
        }
        pending.append(buffer, static_cast<std::size_t>(count));

        std::size_t newline = std::string::npos;
        while ((newline = pending.find('\n')) != std::string::npos)
        {
            const std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);

            std::string error;
            const auto command = tracker::parse_console_command(line, error);
            if (!command)
            {
                if (!error.empty())
                {
                    std::cout << "error: " << error << '\n' << std::flush;
                }
                continue;
            }

            std::cout << tracker::apply_console_command(runtime, *command) << std::flush;
            if (command->action == tracker::ConsoleAction::Quit)
            {
                return false;
            }
        }
        return true;
    }
}

int main(int argc, char* argv[])
{
    const ProgramOptions options = parse_options(argc, argv);

    auto console = spdlog::stdout_color_mt(tracker_name);
    spdlog::set_default_logger(console);

    if (options.mode == Mode::ShowHelp)
    {
        print_usage();
        return 0;
    }
    if (!options.error.empty())
    {
        spdlog::error("{}", options.error);
        print_usage();
        return 2;
    }

    tracker::TrackerConfig config;
    if (!load_config(options, config))
    {
        spdlog::shutdown();
        return 1;
    }
    configure_logging(config);
    spdlog::info("{} starting up", tracker_name);

    if (options.mode == Mode::QueryTotals)
    {
        config.snapshotIntervalSeconds = 0;
    }

    tracker::TrackerRuntime runtime(std::move(config));
    if (!runtime.start())
    {
        spdlog::error("Unable to start tracker: {}", runtime.getStatus().lastErrorMessage);
        spdlog::shutdown();
        return 1;
    }

    if (options.mode == Mode::QueryTotals)
    {
        int exitCode = 0;
        try
        {
            std::cout << runtime.playedReport(options.identity);
        }
        catch (const std::exception& ex)
        {
            spdlog::error("Totals query failed: {}", ex.what());
            exitCode = 1;
        }
        runtime.stop();
        spdlog::shutdown();
        return exitCode;
    }

    struct sigaction action{};
    action.sa_handler = termination_handler;
    sigemptyset(&action.sa_mask);
    if (::sigaction(SIGINT, &action, nullptr) != 0 || ::sigaction(SIGTERM, &action, nullptr) != 0)
    {
        spdlog::warn("Failed to install termination handlers");
    }

    spdlog::info("Reading commands from stdin; Ctrl+C or 'quit' to shut down.");
    std::string pending;
    while (is_running())
    {
        if (!pump_console(runtime, pending))
        {
            break;
        }
    }

    spdlog::info("Shutting down: saving running sessions...");
    runtime.stop();

    spdlog::info("Tracker terminated cleanly.");
    spdlog::shutdown();
    return 0;
}
