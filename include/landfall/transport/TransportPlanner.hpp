#pragma once
#include "GameView.hpp"
#include "landfall/pathfinding/BfsKernel.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace landfall::transport {

// Why the last can_build_transport_ship() call said no.
enum class BuildRejection : pf::u8 {
    None,
    UnitCap,
    NoTarget,
    OwnTerritory,
    NotAttackable,
    NoOceanAccess,
    NoLakeAccess,
    NoSpawnShore,
};

[[nodiscard]] const char* to_string(BuildRejection r) noexcept;

// Picks landing shores and launch points for transport ships.
//
// Every query is a handful of BFS runs on the planner's own engine, so one planner
// serves one thread of control. Results are std::nullopt when nothing was found or
// the move is not permitted; last_rejection() tells the two apart for the build gate.
class TransportPlanner {
public:
    TransportPlanner() = default;
    explicit TransportPlanner(pf::BfsEngine engine) : m_bfs(std::move(engine)) {}

    // Landing shore for a click on `tile`: the owner's nearest border shore when the tile
    // is owned, otherwise the nearest shore across neutral ground and water.
    std::optional<TileRef> target_transport_tile(const GameView& game, TileRef tile);

    // Spawn tile if `player` may launch a transport toward `tile`.
    std::optional<TileRef> can_build_transport_ship(const GameView& game, const PlayerView& player, TileRef tile);

    // Requires `targetShore` to be a shore, then finds the player's nearest border shore to it.
    std::optional<TileRef> resolve_transport_spawn(const GameView& game, const PlayerView& player, TileRef targetShore);

    // {source shore of `player`, destination shore near `tile`}; either side may be empty.
    std::pair<std::optional<TileRef>, std::optional<TileRef>>
    source_dst_ocean_shore(const GameView& game, const PlayerView& player, TileRef tile);

    std::optional<TileRef> best_shore_deployment_source(const GameView& game, const PlayerView& player, TileRef target);

    // Nearest border shore first, then the four axis extremes, then a strided sample.
    // Empty when the player has no border shore.
    std::vector<TileRef> candidate_shore_tiles(const GameView& game, const PlayerView& player, TileRef target);

    // Player's border shore nearest to `target` by water.
    std::optional<TileRef> closest_shore_from_player(const pf::TerrainMap& map, const PlayerView& player,
                                                     TileRef target,
                                                     int maxDepth = TransportConfig{}.borderShoreSearchDepth);

    std::optional<TileRef> find_closest_shore(const pf::TerrainMap& map, TileRef tile, int maxDepth) {
        return m_bfs.find_closest_shore(map, tile, maxDepth);
    }

    [[nodiscard]] BuildRejection last_rejection() const noexcept { return m_lastRejection; }
    [[nodiscard]] const pf::BfsEngine& engine() const noexcept { return m_bfs; }

private:
    std::optional<TileRef> reject(BuildRejection why, TileRef tile);

    std::optional<TileRef> can_build_ocean_transport(const GameView& game, const PlayerView& player,
                                                     const PlayerView* targetOwner, TileRef destination);
    std::optional<TileRef> can_build_lake_transport(const GameView& game, const PlayerView& player,
                                                    TileRef destination);

    pf::BfsEngine  m_bfs;
    pf::TileSet    m_shoreScratch;
    BuildRejection m_lastRejection = BuildRejection::None;
};

// True if any border tile of `player` touches the ocean.
[[nodiscard]] bool has_ocean_border(const pf::TerrainMap& map, const PlayerView& player);

} // namespace landfall::transport
