#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace landfall::app {

enum class ProbeCommand {
    Target,      // target
    Spawn,       // spawn
    CanBuild,    // can-build
    Pair,        // pair
    Candidates,  // candidates
    BestSource,  // best-source
};

// Parsed command line for landfall_probe.
//
// Notes:
//   - Option names are case-insensitive.
//   - Both "--opt=value" and "--opt value" forms are supported.
//   - Positionals: <command> <x> <y>
struct ProbeArgs
{
    bool showHelp = false;              // --help / -h
    bool verbose  = false;              // --verbose / -v

    std::string mapPath;                // --map <file>
    std::optional<std::string> configPath; // --config <file.json>
    int player = 1;                     // --player <id>
    std::optional<std::string> logDir;  // --log-dir <dir>: also log to <dir>/landfall.log

    std::optional<ProbeCommand> command;
    std::optional<int> x;
    std::optional<int> y;

    // Unknown options and bad values, in the order they were seen.
    std::vector<std::string> unknown;
    std::vector<std::string> errors;

    [[nodiscard]] bool ok() const noexcept {
        return showHelp || (unknown.empty() && errors.empty() && !mapPath.empty() && command && x && y);
    }
};

[[nodiscard]] ProbeArgs ParseProbeArgs(const std::vector<std::string_view>& argv);

[[nodiscard]] std::optional<ProbeCommand> ParseProbeCommand(std::string_view s);
[[nodiscard]] const char* ToString(ProbeCommand c) noexcept;

[[nodiscard]] std::string BuildProbeHelpText();

} // namespace landfall::app
