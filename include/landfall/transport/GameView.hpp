#pragma once
#include "landfall/pathfinding/TerrainMap.hpp"
#include "TransportConfig.hpp"
#include <vector>

namespace landfall::transport {

using pf::PlayerId;
using pf::TileRef;

enum class UnitType : pf::u8 {
    TransportShip,
};

// Read-only view of one player's bookkeeping.
struct PlayerView {
    virtual ~PlayerView() = default;
    [[nodiscard]] virtual PlayerId id() const = 0;
    // Owned tiles with at least one cardinal neighbour not owned by this player.
    [[nodiscard]] virtual const std::vector<TileRef>& border_tiles() const = 0;
    [[nodiscard]] virtual int unit_count(UnitType type) const = 0;
    [[nodiscard]] virtual bool can_attack(PlayerId other) const = 0;
};

// Read-only view of the game: terrain, players, configuration.
struct GameView {
    virtual ~GameView() = default;
    [[nodiscard]] virtual const pf::TerrainMap& map() const = 0;
    // nullptr for kNoOwner and unknown ids.
    [[nodiscard]] virtual const PlayerView* player(PlayerId id) const = 0;
    [[nodiscard]] virtual const TransportConfig& config() const = 0;

    [[nodiscard]] const PlayerView* owner_of(TileRef t) const { return player(map().owner(t)); }
};

} // namespace landfall::transport
