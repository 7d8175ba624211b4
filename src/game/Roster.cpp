#include "landfall/game/Roster.hpp"
#include "logging/Log.h"

#include <cassert>
#include <utility>

namespace landfall::game {

int PlayerState::unit_count(transport::UnitType type) const
{
    const auto it = m_units.find(type);
    return it == m_units.end() ? 0 : it->second;
}

bool PlayerState::can_attack(PlayerId other) const
{
    return other != m_id && m_allies.count(other) == 0;
}

void PlayerState::set_unit_count(transport::UnitType type, int n)
{
    m_units[type] = n;
}

void PlayerState::set_allied(PlayerId other, bool allied)
{
    if (allied) m_allies.insert(other);
    else        m_allies.erase(other);
}

Roster::Roster(pf::GridMap map, transport::TransportConfig cfg)
    : m_map(std::move(map)), m_cfg(cfg)
{
    // Owners painted into the map get a player entry up front.
    for (TileRef t = 0; t < m_map.size(); ++t)
        if (const PlayerId p = m_map.owner(t); p != pf::kNoOwner)
            m_players.try_emplace(p, p);
    refresh_borders();
}

const transport::PlayerView* Roster::player(PlayerId id) const
{
    if (id == pf::kNoOwner) return nullptr;
    const auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

PlayerState& Roster::add_player(PlayerId id)
{
    assert(id != pf::kNoOwner);
    return m_players.try_emplace(id, id).first->second;
}

PlayerState* Roster::find(PlayerId id)
{
    const auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

void Roster::conquer(PlayerId id, TileRef t)
{
    add_player(id);
    m_map.set_owner(t, id);
    refresh_borders();
}

void Roster::refresh_borders()
{
    for (auto& [id, p] : m_players)
        p.m_border.clear();

    const pf::u32 width = static_cast<pf::u32>(m_map.width());
    const pf::u32 size  = m_map.size();
    for (TileRef t = 0; t < size; ++t) {
        const PlayerId owner = m_map.owner(t);
        if (owner == pf::kNoOwner) continue;

        bool border = false;
        pf::for_each_cardinal(t, width, size, [&](TileRef n) {
            if (m_map.owner(n) != owner) border = true;
        });
        if (!border) continue;

        if (auto it = m_players.find(owner); it != m_players.end())
            it->second.m_border.push_back(t);
    }

    logsys::get()->debug("Roster: borders refreshed for {} players", m_players.size());
}

} // namespace landfall::game
