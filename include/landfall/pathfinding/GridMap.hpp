#pragma once
#include "TerrainMap.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace landfall::pf {

enum class Terrain : u8 { Land = 0, Ocean = 1, Lake = 2 };

// In-memory terrain grid with an ownership layer.
// Shore flags are derived from the terrain layer and kept current by set_terrain().
class GridMap final : public TerrainMap {
public:
    GridMap() = default;
    GridMap(int w, int h)
        : _b{w, h}, _terrain(_b.size(), Terrain::Land), _shore(_b.size(), 0), _owner(_b.size(), kNoOwner) {}

    // Rows of '.' land, '~' ocean, '-' lake, '1'..'9' land owned by that player.
    // Blank lines and lines starting with ';' are skipped. Rows must share one width.
    [[nodiscard]] static std::optional<GridMap> from_ascii(std::string_view text);

    [[nodiscard]] int width()  const override { return _b.w; }
    [[nodiscard]] int height() const override { return _b.h; }
    [[nodiscard]] const Bounds& bounds() const noexcept { return _b; }

    void set_terrain(int x, int y, Terrain t);
    [[nodiscard]] Terrain terrain(TileRef t) const { return _terrain[t]; }

    // Paints a rectangle [x0,x1] x [y0,y1] (inclusive) in one pass.
    void fill(int x0, int y0, int x1, int y1, Terrain t);

    void set_owner(TileRef t, PlayerId p) { _owner[t] = p; }
    void set_owner(int x, int y, PlayerId p) { _owner[to_ref(x, y, _b.w)] = p; }

    [[nodiscard]] bool is_land(TileRef t)  const override { return _terrain[t] == Terrain::Land; }
    [[nodiscard]] bool is_lake(TileRef t)  const override { return _terrain[t] == Terrain::Lake; }
    [[nodiscard]] bool is_ocean(TileRef t) const override { return _terrain[t] == Terrain::Ocean; }
    [[nodiscard]] bool is_water(TileRef t) const { return _terrain[t] != Terrain::Land; }

    [[nodiscard]] bool is_shore(TileRef t)       const override { return _shore[t] != 0; }
    [[nodiscard]] bool is_ocean_shore(TileRef t) const override { return (_shore[t] & kTouchesOcean) != 0; }
    [[nodiscard]] bool is_lake_shore(TileRef t)  const { return (_shore[t] & kTouchesLake) != 0; }

    [[nodiscard]] PlayerId owner(TileRef t) const override { return _owner[t]; }

    // Inverse of from_ascii. std::nullopt if an owner is above 9 or sits on water,
    // since neither can be written back in the legend above.
    [[nodiscard]] std::optional<std::string> to_ascii() const;

private:
    static constexpr u8 kTouchesOcean = 1;
    static constexpr u8 kTouchesLake  = 2;

    void refresh_shore(TileRef t);
    void refresh_around(int x, int y);

    Bounds _b{};
    std::vector<Terrain>  _terrain;
    std::vector<u8>       _shore;   // kTouchesOcean | kTouchesLake, land tiles only
    std::vector<PlayerId> _owner;
};

} // namespace landfall::pf
