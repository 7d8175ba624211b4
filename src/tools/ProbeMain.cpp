// src/tools/ProbeMain.cpp
//
// landfall_probe: loads an ASCII map (and optional transport config) and runs one
// targeting query from the command line. Handy for checking map fixtures and for
// reproducing odd landing decisions outside the game.
//
// Exit codes: 0 result found, 1 query yielded nothing, 2 usage or load error.

#include "app/ProbeArgs.h"
#include "logging/Log.h"

#include "landfall/game/Roster.hpp"
#include "landfall/pathfinding/GridMap.hpp"
#include "landfall/transport/TransportConfig.hpp"
#include "landfall/transport/TransportPlanner.hpp"

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace landfall;

namespace {

constexpr int kExitFound    = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitUsage    = 2;

std::optional<std::string> ReadText(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

void PrintTile(const pf::TerrainMap& map, const char* label, std::optional<pf::TileRef> t)
{
    if (t)
    {
        const pf::IVec2 p = pf::from_ref(*t, map.width());
        std::printf("%s: %u (%d, %d)\n", label, *t, p.x, p.y);
    }
    else
        std::printf("%s: none\n", label);
}

int RunQuery(transport::TransportPlanner& planner, const game::Roster& roster, app::ProbeCommand command,
             const transport::PlayerView* player, pf::TileRef tile)
{
    const auto& map = roster.map();
    switch (command)
    {
    case app::ProbeCommand::Target:
    {
        const auto t = planner.target_transport_tile(roster, tile);
        PrintTile(map, "target", t);
        return t ? kExitFound : kExitNotFound;
    }
    case app::ProbeCommand::Spawn:
    {
        const auto t = planner.resolve_transport_spawn(roster, *player, tile);
        PrintTile(map, "spawn", t);
        return t ? kExitFound : kExitNotFound;
    }
    case app::ProbeCommand::CanBuild:
    {
        const auto t = planner.can_build_transport_ship(roster, *player, tile);
        PrintTile(map, "spawn", t);
        if (!t)
            std::printf("rejected: %s\n", transport::to_string(planner.last_rejection()));
        return t ? kExitFound : kExitNotFound;
    }
    case app::ProbeCommand::Pair:
    {
        const auto [src, dst] = planner.source_dst_ocean_shore(roster, *player, tile);
        PrintTile(map, "source", src);
        PrintTile(map, "destination", dst);
        return (src && dst) ? kExitFound : kExitNotFound;
    }
    case app::ProbeCommand::Candidates:
    {
        const auto tiles = planner.candidate_shore_tiles(roster, *player, tile);
        for (const auto t : tiles)
            PrintTile(map, "candidate", t);
        return tiles.empty() ? kExitNotFound : kExitFound;
    }
    case app::ProbeCommand::BestSource:
    {
        const auto t = planner.best_shore_deployment_source(roster, *player, tile);
        PrintTile(map, "source", t);
        return t ? kExitFound : kExitNotFound;
    }
    }
    return kExitUsage;
}

int Run(const app::ProbeArgs& args)
{
    const auto text = ReadText(args.mapPath);
    if (!text)
    {
        logsys::get()->error("cannot read map {}", args.mapPath);
        return kExitUsage;
    }

    auto grid = pf::GridMap::from_ascii(*text);
    if (!grid)
    {
        logsys::get()->error("map {} is malformed", args.mapPath);
        return kExitUsage;
    }

    transport::TransportConfig cfg;
    if (args.configPath && !transport::LoadTransportConfig(*args.configPath, cfg))
    {
        logsys::get()->error("cannot load config {}", *args.configPath);
        return kExitUsage;
    }

    game::Roster roster(std::move(*grid), cfg);
    const auto& map = roster.map();

    if (!roster.grid().bounds().contains(*args.x, *args.y))
    {
        logsys::get()->error("({}, {}) is outside the {}x{} map", *args.x, *args.y, map.width(), map.height());
        return kExitUsage;
    }
    const pf::TileRef tile = map.ref(*args.x, *args.y);

    const auto playerId = static_cast<pf::PlayerId>(args.player);
    const transport::PlayerView* player = roster.player(playerId);
    if (!player && *args.command != app::ProbeCommand::Target)
    {
        logsys::get()->error("player {} owns nothing on this map", args.player);
        return kExitUsage;
    }

    transport::TransportPlanner planner;
    const int rc = RunQuery(planner, roster, *args.command, player, tile);

    const pf::BfsStats& stats = planner.engine().last_search_stats();
    logsys::get()->debug("{}: last search reached depth {}, visited {} tiles",
                         app::ToString(*args.command), stats.depth, stats.visited);
    logsys::get()->flush();
    return rc;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i]);

    const app::ProbeArgs args = app::ParseProbeArgs(v);
    const auto level = args.verbose ? spdlog::level::trace : spdlog::level::warn;
    if (args.logDir)
    {
        try
        {
            logsys::init_file_logs(*args.logDir, args.verbose ? spdlog::level::trace : spdlog::level::debug);
        }
        catch (const spdlog::spdlog_ex& e)
        {
            logsys::init_console_logs(level);
            logsys::get()->error("cannot log to {}: {}", *args.logDir, e.what());
            return kExitUsage;
        }
    }
    else
    {
        logsys::init_console_logs(level);
    }

    if (args.showHelp)
    {
        std::fputs(app::BuildProbeHelpText().c_str(), stdout);
        return kExitFound;
    }

    if (!args.ok())
    {
        for (const auto& u : args.unknown)
            logsys::get()->error("unknown argument '{}'", u);
        for (const auto& e : args.errors)
            logsys::get()->error("{}", e);
        std::fputs(app::BuildProbeHelpText().c_str(), stderr);
        return kExitUsage;
    }

    return Run(args);
}
