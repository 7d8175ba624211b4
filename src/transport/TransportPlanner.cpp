#include "landfall/transport/TransportPlanner.hpp"
#include "logging/Log.h"

#include <algorithm>
#include <unordered_set>

namespace landfall::transport {

namespace {

struct BorderShores {
    std::vector<TileRef> tiles;
    TileRef minX = pf::kInvalidTile;
    TileRef minY = pf::kInvalidTile;
    TileRef maxX = pf::kInvalidTile;
    TileRef maxY = pf::kInvalidTile;
};

// Border shores plus the tiles at each axis extreme; ties go to the higher tile index.
BorderShores collect_with_extremes(const pf::TerrainMap& map, const PlayerView& player)
{
    BorderShores out;
    int minX = 0, minY = 0, maxX = 0, maxY = 0;

    for (const TileRef t : player.border_tiles()) {
        if (!map.is_shore(t)) continue;
        out.tiles.push_back(t);

        const int x = map.x(t);
        const int y = map.y(t);
        if (out.tiles.size() == 1) {
            minX = maxX = x;
            minY = maxY = y;
            out.minX = out.minY = out.maxX = out.maxY = t;
            continue;
        }
        if (x < minX || (x == minX && t > out.minX)) { minX = x; out.minX = t; }
        if (y < minY || (y == minY && t > out.minY)) { minY = y; out.minY = t; }
        if (x > maxX || (x == maxX && t > out.maxX)) { maxX = x; out.maxX = t; }
        if (y > maxY || (y == maxY && t > out.maxY)) { maxY = y; out.maxY = t; }
    }
    return out;
}

} // namespace

const char* to_string(BuildRejection r) noexcept
{
    switch (r) {
    case BuildRejection::None:          return "none";
    case BuildRejection::UnitCap:       return "unit cap reached";
    case BuildRejection::NoTarget:      return "no reachable target shore";
    case BuildRejection::OwnTerritory:  return "target is own territory";
    case BuildRejection::NotAttackable: return "diplomacy forbids attacking target owner";
    case BuildRejection::NoOceanAccess: return "no ocean border on one side";
    case BuildRejection::NoLakeAccess:  return "no own territory on the target lake";
    case BuildRejection::NoSpawnShore:  return "no spawn shore";
    }
    return "unknown";
}

bool has_ocean_border(const pf::TerrainMap& map, const PlayerView& player)
{
    const auto& border = player.border_tiles();
    return std::any_of(border.begin(), border.end(),
                       [&map](TileRef t) { return map.is_ocean_shore(t); });
}

std::optional<TileRef> TransportPlanner::closest_shore_from_player(const pf::TerrainMap& map,
                                                                   const PlayerView& player,
                                                                   TileRef target, int maxDepth)
{
    m_shoreScratch.clear();
    for (const TileRef t : player.border_tiles())
        if (map.is_shore(t))
            m_shoreScratch.insert(t);

    if (m_shoreScratch.empty())
        return std::nullopt;

    return m_bfs.find_closest_in_set(map, target, m_shoreScratch, maxDepth);
}

std::optional<TileRef> TransportPlanner::target_transport_tile(const GameView& game, TileRef tile)
{
    const auto& map = game.map();
    if (const PlayerView* owner = game.owner_of(tile))
        return closest_shore_from_player(map, *owner, tile, game.config().borderShoreSearchDepth);

    return m_bfs.find_closest_shore(map, tile, game.config().terraNulliusSearchDepth);
}

std::optional<TileRef> TransportPlanner::resolve_transport_spawn(const GameView& game, const PlayerView& player,
                                                                 TileRef targetShore)
{
    const auto& map = game.map();
    if (!map.is_shore(targetShore))
        return std::nullopt;

    return closest_shore_from_player(map, player, targetShore, game.config().borderShoreSearchDepth);
}

std::optional<TileRef> TransportPlanner::reject(BuildRejection why, TileRef tile)
{
    m_lastRejection = why;
    logsys::get()->trace("can_build_transport_ship({}): {}", tile, to_string(why));
    return std::nullopt;
}

std::optional<TileRef> TransportPlanner::can_build_transport_ship(const GameView& game, const PlayerView& player,
                                                                  TileRef tile)
{
    m_lastRejection = BuildRejection::None;
    const auto& map = game.map();

    if (player.unit_count(UnitType::TransportShip) >= game.config().boatMaxNumber)
        return reject(BuildRejection::UnitCap, tile);

    const auto destination = target_transport_tile(game, tile);
    if (!destination)
        return reject(BuildRejection::NoTarget, tile);

    // Ownership and diplomacy follow the clicked tile, not the resolved shore.
    const PlayerId ownerId = map.owner(tile);
    if (ownerId == player.id())
        return reject(BuildRejection::OwnTerritory, tile);

    const PlayerView* targetOwner = game.player(ownerId);
    if (targetOwner && !player.can_attack(ownerId))
        return reject(BuildRejection::NotAttackable, tile);

    if (map.is_ocean_shore(*destination))
        return can_build_ocean_transport(game, player, targetOwner, *destination);

    return can_build_lake_transport(game, player, *destination);
}

std::optional<TileRef> TransportPlanner::can_build_ocean_transport(const GameView& game, const PlayerView& player,
                                                                   const PlayerView* targetOwner, TileRef destination)
{
    const auto& map = game.map();
    const bool playerBordersOcean = has_ocean_border(map, player);
    const bool targetBordersOcean = targetOwner ? has_ocean_border(map, *targetOwner) : true;

    if (!playerBordersOcean || !targetBordersOcean)
        return reject(BuildRejection::NoOceanAccess, destination);

    const auto spawn = resolve_transport_spawn(game, player, destination);
    if (!spawn)
        return reject(BuildRejection::NoSpawnShore, destination);
    return spawn;
}

std::optional<TileRef> TransportPlanner::can_build_lake_transport(const GameView& game, const PlayerView& player,
                                                                  TileRef destination)
{
    const auto& map = game.map();
    const auto ownShore = m_bfs.find_owned_lake_shore(map, destination, player.id(),
                                                      game.config().lakeSearchDepth);
    if (!ownShore)
        return reject(BuildRejection::NoLakeAccess, destination);

    const auto spawn = resolve_transport_spawn(game, player, *ownShore);
    if (!spawn)
        return reject(BuildRejection::NoSpawnShore, destination);
    return spawn;
}

std::pair<std::optional<TileRef>, std::optional<TileRef>>
TransportPlanner::source_dst_ocean_shore(const GameView& game, const PlayerView& player, TileRef tile)
{
    const auto& map = game.map();
    const auto& cfg = game.config();

    const auto source = closest_shore_from_player(map, player, tile, cfg.borderShoreSearchDepth);

    std::optional<TileRef> destination;
    if (const PlayerView* owner = game.owner_of(tile))
        destination = closest_shore_from_player(map, *owner, tile, cfg.borderShoreSearchDepth);
    else
        destination = m_bfs.find_closest_shore(map, tile, cfg.terraNulliusSearchDepth);

    return {source, destination};
}

std::optional<TileRef> TransportPlanner::best_shore_deployment_source(const GameView& game, const PlayerView& player,
                                                                      TileRef target)
{
    const auto transportTarget = target_transport_tile(game, target);
    if (!transportTarget)
        return std::nullopt;

    const auto& map = game.map();
    const auto best = closest_shore_from_player(map, player, *transportTarget,
                                                game.config().borderShoreSearchDepth);
    if (!best)
        return std::nullopt;

    if (!map.is_shore(*best) || map.owner(*best) != player.id())
        return std::nullopt;

    return best;
}

std::vector<TileRef> TransportPlanner::candidate_shore_tiles(const GameView& game, const PlayerView& player,
                                                             TileRef target)
{
    const auto& map = game.map();
    const auto& cfg = game.config();

    const BorderShores shores = collect_with_extremes(map, player);
    if (shores.tiles.empty())
        return {};

    m_shoreScratch.clear();
    m_shoreScratch.insert(shores.tiles.begin(), shores.tiles.end());
    const auto closest = m_bfs.find_closest_in_set(map, target, m_shoreScratch, cfg.borderShoreSearchDepth);

    std::vector<TileRef> candidates;
    std::unordered_set<TileRef> seen;
    auto add_unique = [&](TileRef t) {
        if (t != pf::kInvalidTile && seen.insert(t).second)
            candidates.push_back(t);
    };

    add_unique(closest.value_or(pf::kInvalidTile));
    add_unique(shores.minX);
    add_unique(shores.minY);
    add_unique(shores.maxX);
    add_unique(shores.maxY);

    const size_t n = shores.tiles.size();
    const size_t divisor = static_cast<size_t>(std::max(cfg.shoreSamplingDivisor, 1));
    const size_t stride = std::max(static_cast<size_t>(std::max(cfg.minSamplingInterval, 1)),
                                   (n + divisor - 1) / divisor);
    for (size_t i = 0; i < n; i += stride)
        add_unique(shores.tiles[i]);

    return candidates;
}

} // namespace landfall::transport
