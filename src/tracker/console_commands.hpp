#pragma once

#include <optional>
#include <string>

namespace tracker
{
    class TrackerRuntime;

    enum class ConsoleAction
    {
        Start,
        End,
        Presence,
        Totals,
        Snapshot,
        Status,
        Help,
        Quit
    };

    struct ConsoleCommand
    {
        ConsoleAction action{ConsoleAction::Help};
        std::string identity;
        std::optional<std::string> activity;
    };

    // One command per line, e.g. "start 1234 Factorio" or "presence 1234".
    // Activity ids run to the end of the line. Returns nullopt and fills error
    // for anything malformed; blank lines yield nullopt with an empty error.
    [[nodiscard]] std::optional<ConsoleCommand> parse_console_command(const std::string& line, std::string& error);

    // Executes command against runtime and returns the text to print.
    std::string apply_console_command(TrackerRuntime& runtime, const ConsoleCommand& command);

    [[nodiscard]] std::string console_help();
}
