#pragma once
#include "GridTypes.hpp"

namespace landfall::pf {

// Adapter to the world's terrain and ownership tables.
// Implement this around your existing map; the search code never mutates it.
//
// Classification contract:
//   - every tile is land or water; water is ocean or lake
//   - a shore is a land tile with at least one water neighbour
//   - an ocean shore is a shore with at least one ocean neighbour
class TerrainMap {
public:
    virtual ~TerrainMap() = default;

    [[nodiscard]] virtual int width()  const = 0;
    [[nodiscard]] virtual int height() const = 0;

    [[nodiscard]] virtual bool is_land(TileRef t)        const = 0;
    [[nodiscard]] virtual bool is_lake(TileRef t)        const = 0;
    [[nodiscard]] virtual bool is_ocean(TileRef t)       const = 0;
    [[nodiscard]] virtual bool is_shore(TileRef t)       const = 0;
    [[nodiscard]] virtual bool is_ocean_shore(TileRef t) const = 0;

    // kNoOwner for terra nullius.
    [[nodiscard]] virtual PlayerId owner(TileRef t) const = 0;

    [[nodiscard]] bool has_owner(TileRef t) const { return owner(t) != kNoOwner; }

    [[nodiscard]] u32 size() const noexcept {
        return static_cast<u32>(width()) * static_cast<u32>(height());
    }
    [[nodiscard]] bool in_bounds(TileRef t) const noexcept { return t < size(); }

    [[nodiscard]] int x(TileRef t) const { return int(t % u32(width())); }
    [[nodiscard]] int y(TileRef t) const { return int(t / u32(width())); }
    [[nodiscard]] TileRef ref(int x, int y) const { return to_ref(x, y, width()); }
};

} // namespace landfall::pf
