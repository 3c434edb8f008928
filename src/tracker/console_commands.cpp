#include "console_commands.hpp"
#include "playtime_report.hpp"
#include "tracker_runtime.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace tracker
{
    namespace
    {
        bool is_space(char ch)
        {
            return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
        }

        std::string trim(const std::string& value)
        {
            std::size_t start = 0;
            while (start < value.size() && is_space(value[start]))
            {
                ++start;
            }
            std::size_t end = value.size();
            while (end > start && is_space(value[end - 1]))
            {
                --end;
            }
            return value.substr(start, end - start);
        }

        // Splits off the first whitespace-delimited word; rest is trimmed.
        std::string take_word(std::string& rest)
        {
            rest = trim(rest);
            std::size_t end = 0;
            while (end < rest.size() && !is_space(rest[end]))
            {
                ++end;
            }
            std::string word = rest.substr(0, end);
            rest = trim(rest.substr(end));
            return word;
        }
    }

    std::optional<ConsoleCommand> parse_console_command(const std::string& line, std::string& error)
    {
        error.clear();
        std::string rest = line;
        const std::string verb = take_word(rest);
        if (verb.empty())
        {
            return std::nullopt;
        }

        ConsoleCommand command;
        if (verb == "snapshot" || verb == "status" || verb == "help" || verb == "quit")
        {
            if (!rest.empty())
            {
                error = verb + " takes no arguments";
                return std::nullopt;
            }
            command.action = verb == "snapshot" ? ConsoleAction::Snapshot
                : verb == "status"              ? ConsoleAction::Status
                : verb == "help"                ? ConsoleAction::Help
                                                : ConsoleAction::Quit;
            return command;
        }

        if (verb != "start" && verb != "end" && verb != "presence" && verb != "totals")
        {
            error = "Unsupported command: " + verb;
            return std::nullopt;
        }

        command.identity = take_word(rest);
        if (command.identity.empty())
        {
            error = verb + " requires an identity";
            return std::nullopt;
        }

        if (verb == "start")
        {
            if (rest.empty())
            {
                error = "start requires an activity";
                return std::nullopt;
            }
            command.action = ConsoleAction::Start;
            command.activity = rest;
        }
        else if (verb == "presence")
        {
            command.action = ConsoleAction::Presence;
            if (!rest.empty())
            {
                command.activity = rest;
            }
        }
        else
        {
            if (!rest.empty())
            {
                error = verb + " takes only an identity";
                return std::nullopt;
            }
            command.action = verb == "end" ? ConsoleAction::End : ConsoleAction::Totals;
        }

        return command;
    }

    std::string apply_console_command(TrackerRuntime& runtime, const ConsoleCommand& command)
    {
        switch (command.action)
        {
            case ConsoleAction::Start:
                runtime.onActivityStarted(command.identity, *command.activity);
                return "ok\n";

            case ConsoleAction::End:
                return runtime.onActivityEnded(command.identity) ? "ok\n" : "no live session\n";

            case ConsoleAction::Presence:
                runtime.onPresence(command.identity, command.activity);
                return "ok\n";

            case ConsoleAction::Totals:
                try
                {
                    return runtime.playedReport(command.identity);
                }
                catch (const std::exception& ex)
                {
                    spdlog::error("Totals query for {} failed: {}", command.identity, ex.what());
                    return std::string{"error: "} + ex.what() + "\n";
                }

            case ConsoleAction::Snapshot:
            {
                std::ostringstream oss;
                oss << "flushed " << runtime.snapshotNow() << " session(s)\n";
                return oss.str();
            }

            case ConsoleAction::Status:
            {
                const auto status = runtime.getStatus();
                std::ostringstream oss;
                oss << "running: " << (status.running ? "yes" : "no") << '\n'
                    << "live sessions: " << status.liveSessions << '\n'
                    << "catalogued activities: " << status.catalogEntries << '\n'
                    << "snapshots taken: " << status.snapshotsTaken << '\n';
                if (!status.lastErrorMessage.empty())
                {
                    oss << "last error: " << status.lastErrorMessage << '\n';
                }
                return oss.str();
            }

            case ConsoleAction::Help:
                return console_help();

            case ConsoleAction::Quit:
                return "bye\n";
        }

        return {};
    }

    std::string console_help()
    {
        return "Available commands:\n"
               "  start <identity> <activity>     begin counting\n"
               "  end <identity>                  stop counting and save\n"
               "  presence <identity> [activity]  presence update; no activity ends the session\n"
               "  totals <identity>               show saved play time\n"
               "  snapshot                        save all running sessions now\n"
               "  status                          runtime status\n"
               "  quit                            save and exit\n";
    }
}
