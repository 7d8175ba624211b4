#pragma once
#include <cstdint>
#include <limits>

namespace landfall::pf {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;

// Dense row-major tile index in [0, width*height).
using TileRef = u32;

// Small player id. 0 is terra nullius.
using PlayerId = u16;
constexpr PlayerId kNoOwner = 0;

constexpr TileRef kInvalidTile = std::numeric_limits<TileRef>::max();

struct IVec2 {
    int x{}, y{};
    constexpr bool operator==(const IVec2&) const = default;
};

struct Bounds {
    int w{}, h{};
    [[nodiscard]] constexpr bool contains(int x, int y) const noexcept {
        return (x >= 0 && y >= 0 && x < w && y < h);
    }
    [[nodiscard]] constexpr u32 size() const noexcept {
        return static_cast<u32>(w) * static_cast<u32>(h);
    }
};

// Encode/decode (x,y) <-> TileRef (row-major)
inline TileRef to_ref(int x, int y, int width) { return static_cast<TileRef>(y * width + x); }
inline IVec2   from_ref(TileRef t, int width)  { return { int(t % u32(width)), int(t / u32(width)) }; }

// Visits the in-bounds cardinal neighbours of `t` in the order up, down, left, right.
// No wraparound across rows or columns.
template <class Fn>
inline void for_each_cardinal(TileRef t, u32 width, u32 size, Fn&& fn) {
    const u32 lastRowStart = size - width;
    const u32 col = t % width;
    if (t >= width)       fn(t - width);
    if (t < lastRowStart) fn(t + width);
    if (col > 0)          fn(t - 1);
    if (col + 1 < width)  fn(t + 1);
}

} // namespace landfall::pf
