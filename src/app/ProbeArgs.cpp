#include "app/ProbeArgs.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>

namespace landfall::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// True for "--opt" and "--opt=value", but not for "--optional".
[[nodiscard]] bool IsOption(std::string_view arg, std::string_view name)
{
    return StartsWith(arg, name) && (arg.size() == name.size() || arg[name.size()] == '=');
}

// Accepts "--opt=value".
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (!StartsWith(arg, prefix) || arg.size() == prefix.size() || arg[prefix.size()] != '=')
        return false;
    outValue = arg.substr(prefix.size() + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

} // namespace

std::optional<ProbeCommand> ParseProbeCommand(std::string_view s)
{
    const std::string k = ToLower(s);
    if (k == "target")      return ProbeCommand::Target;
    if (k == "spawn")       return ProbeCommand::Spawn;
    if (k == "can-build")   return ProbeCommand::CanBuild;
    if (k == "pair")        return ProbeCommand::Pair;
    if (k == "candidates")  return ProbeCommand::Candidates;
    if (k == "best-source") return ProbeCommand::BestSource;
    return std::nullopt;
}

const char* ToString(ProbeCommand c) noexcept
{
    switch (c) {
    case ProbeCommand::Target:     return "target";
    case ProbeCommand::Spawn:      return "spawn";
    case ProbeCommand::CanBuild:   return "can-build";
    case ProbeCommand::Pair:       return "pair";
    case ProbeCommand::Candidates: return "candidates";
    case ProbeCommand::BestSource: return "best-source";
    }
    return "?";
}

ProbeArgs ParseProbeArgs(const std::vector<std::string_view>& argv)
{
    ProbeArgs out;
    std::vector<std::string_view> positionals;

    // argv[0] is the program name.
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        if (raw.front() != '-' || raw == "-" || ParseInt(raw))
        {
            positionals.push_back(raw);
            continue;
        }

        const std::string arg = ToLower(raw);

        // "--opt=value" or "--opt value"; values keep their original case.
        auto takeValue = [&](std::string_view name) -> std::optional<std::string_view> {
            std::string_view v;
            if (ConsumeValue(arg, name, v))
                return raw.substr(name.size() + 1);
            if (arg == name && i + 1 < argv.size())
                return argv[++i];
            return std::nullopt;
        };

        if (arg == "--help" || arg == "-h")
        {
            out.showHelp = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            out.verbose = true;
        }
        else if (IsOption(arg, "--map"))
        {
            if (auto v = takeValue("--map")) out.mapPath = std::string(*v);
            else out.errors.emplace_back("--map needs a file");
        }
        else if (IsOption(arg, "--config"))
        {
            if (auto v = takeValue("--config")) out.configPath = std::string(*v);
            else out.errors.emplace_back("--config needs a file");
        }
        else if (IsOption(arg, "--log-dir"))
        {
            if (auto v = takeValue("--log-dir")) out.logDir = std::string(*v);
            else out.errors.emplace_back("--log-dir needs a directory");
        }
        else if (IsOption(arg, "--player"))
        {
            const auto v = takeValue("--player");
            const auto id = v ? ParseInt(*v) : std::nullopt;
            if (id && *id >= 1 && *id <= std::numeric_limits<std::uint16_t>::max())
                out.player = *id;
            else
                out.errors.emplace_back("--player needs an id in [1, 65535]");
        }
        else
        {
            out.unknown.emplace_back(raw);
        }
    }

    if (!positionals.empty())
    {
        out.command = ParseProbeCommand(positionals[0]);
        if (!out.command)
            out.errors.push_back("unknown command '" + std::string(positionals[0]) + "'");
    }
    if (positionals.size() >= 3)
    {
        out.x = ParseInt(positionals[1]);
        out.y = ParseInt(positionals[2]);
        if (!out.x || !out.y)
            out.errors.emplace_back("coordinates must be integers");
    }
    for (std::size_t i = 3; i < positionals.size(); ++i)
        out.unknown.emplace_back(positionals[i]);

    if (!out.showHelp)
    {
        if (out.mapPath.empty() && std::none_of(out.errors.begin(), out.errors.end(),
                                                [](const std::string& e) { return StartsWith(e, "--map"); }))
            out.errors.emplace_back("--map is required");
        if (positionals.empty())
            out.errors.emplace_back("missing <command> <x> <y>");
        else if (positionals.size() < 3)
            out.errors.emplace_back("missing coordinates after '" + std::string(positionals[0]) + "'");
    }

    return out;
}

std::string BuildProbeHelpText()
{
    std::ostringstream oss;
    oss << "usage: landfall_probe --map <file> [--config <file.json>] [--player <id>]\n"
           "                      [--log-dir <dir>] [--verbose] <command> <x> <y>\n"
           "\n"
           "commands:\n"
           "  target       landing shore for a click at (x, y)\n"
           "  spawn        launch shore of --player toward the shore at (x, y)\n"
           "  can-build    spawn tile if --player may send a transport to (x, y)\n"
           "  pair         source and destination shores for (x, y)\n"
           "  candidates   deployment candidate shores of --player toward (x, y)\n"
           "  best-source  best deployment shore of --player toward (x, y)\n"
           "\n"
           "map legend: '.' land, '~' ocean, '-' lake, '1'..'9' land owned by that player\n";
    return oss.str();
}

} // namespace landfall::app
