#pragma once
#include "GridTypes.hpp"
#include <algorithm>
#include <vector>

namespace landfall::pf {

// Per-tile visited stamps that "clear" in O(1) by bumping a generation.
// A tile is visited in the current search iff its stamp equals the generation;
// 0 means never visited since allocation.
class VisitedGenerations {
public:
    static constexpr u32 kInitialGeneration = 1;
    static constexpr u32 kMaxGeneration     = std::numeric_limits<u32>::max();

    VisitedGenerations() = default;

    // Lower ceilings only make sense for exercising the wrap path.
    explicit VisitedGenerations(u32 maxGeneration)
        : _maxGen(std::max(maxGeneration, kInitialGeneration + 1)) {}

    // Returns true if the buffer was (re)allocated.
    bool ensure_capacity(int width, int height) {
        const size_t n = static_cast<size_t>(width) * static_cast<size_t>(height);
        if (_allocated && _stamps.size() == n) return false;
        _stamps.assign(n, 0);
        _gen = kInitialGeneration;
        _allocated = true;
        return true;
    }

    // Opens a new search. Returns true when the generation wrapped and the buffer was cleared.
    bool begin_search() {
        ++_gen;
        if (_gen >= _maxGen) {
            _gen = kInitialGeneration;
            std::fill(_stamps.begin(), _stamps.end(), 0u);
            return true;
        }
        return false;
    }

    void mark(TileRef t) noexcept { _stamps[t] = _gen; }
    [[nodiscard]] bool is_visited(TileRef t) const noexcept { return _stamps[t] == _gen; }

    // Marks t and reports whether it was unvisited before the call.
    bool visit(TileRef t) noexcept {
        if (_stamps[t] == _gen) return false;
        _stamps[t] = _gen;
        return true;
    }

    [[nodiscard]] u32    generation() const noexcept { return _gen; }
    [[nodiscard]] size_t capacity()   const noexcept { return _stamps.size(); }

private:
    std::vector<u32> _stamps;
    u32  _gen{kInitialGeneration};
    u32  _maxGen{kMaxGeneration};
    bool _allocated{false};
};

} // namespace landfall::pf
