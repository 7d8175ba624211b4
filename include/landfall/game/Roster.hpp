#pragma once
#include "landfall/pathfinding/GridMap.hpp"
#include "landfall/transport/GameView.hpp"
#include <map>
#include <set>
#include <vector>

namespace landfall::game {

using pf::PlayerId;
using pf::TileRef;

class PlayerState final : public transport::PlayerView {
public:
    explicit PlayerState(PlayerId id) : m_id(id) {}

    [[nodiscard]] PlayerId id() const override { return m_id; }
    [[nodiscard]] const std::vector<TileRef>& border_tiles() const override { return m_border; }
    [[nodiscard]] int unit_count(transport::UnitType type) const override;
    [[nodiscard]] bool can_attack(PlayerId other) const override;

    void set_unit_count(transport::UnitType type, int n);
    void set_allied(PlayerId other, bool allied);

private:
    friend class Roster;

    PlayerId m_id;
    std::vector<TileRef> m_border;   // ascending tile order
    std::map<transport::UnitType, int> m_units;
    std::set<PlayerId> m_allies;
};

// In-memory game: a grid, its players and the transport config.
// Border tiles are derived from the grid's ownership layer by refresh_borders().
class Roster final : public transport::GameView {
public:
    explicit Roster(pf::GridMap map, transport::TransportConfig cfg = {});

    [[nodiscard]] const pf::TerrainMap& map() const override { return m_map; }
    [[nodiscard]] const transport::PlayerView* player(PlayerId id) const override;
    [[nodiscard]] const transport::TransportConfig& config() const override { return m_cfg; }

    [[nodiscard]] pf::GridMap& grid() noexcept { return m_map; }
    [[nodiscard]] transport::TransportConfig& mutable_config() noexcept { return m_cfg; }

    // Adds the player if missing. Ids must be non-zero.
    PlayerState& add_player(PlayerId id);
    [[nodiscard]] PlayerState* find(PlayerId id);

    // Sets the owner of `t` and refreshes border tiles.
    void conquer(PlayerId id, TileRef t);

    // Recomputes every player's border tiles from the ownership layer.
    void refresh_borders();

private:
    pf::GridMap m_map;
    transport::TransportConfig m_cfg;
    std::map<PlayerId, PlayerState> m_players;
};

} // namespace landfall::game
