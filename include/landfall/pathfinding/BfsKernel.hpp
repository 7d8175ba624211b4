#pragma once
#include "TerrainMap.hpp"
#include "VisitedGenerations.hpp"
#include <cassert>
#include <optional>
#include <unordered_set>
#include <vector>

namespace landfall::pf {

using TileSet = std::unordered_set<TileRef>;

struct BfsStats {
    int depth   = 0;  // levels expanded before returning
    u32 visited = 0;  // tiles stamped, start included
};

// Level-synchronous 4-connected BFS returning the nearest tile that satisfies a match predicate.
//
// One engine is one search context: it owns the visited stamps and both frontier
// buffers, so steady-state searches do not allocate. Searches are not reentrant;
// a predicate must never call back into the engine that is running it.
//
// Among matches at the minimal depth, the highest tile index wins.
class BfsEngine {
public:
    BfsEngine() = default;
    explicit BfsEngine(u32 maxGeneration) : _visited(maxGeneration) {}

    BfsEngine(const BfsEngine&) = delete;
    BfsEngine& operator=(const BfsEngine&) = delete;
    BfsEngine(BfsEngine&&) = default;
    BfsEngine& operator=(BfsEngine&&) = default;

    // Generic traversal. `passable(t)` decides whether the search continues through t,
    // `match(t)` whether t is a goal. Both are evaluated once per discovered tile.
    template <class Passable, class Match>
    std::optional<TileRef> find_nearest(const TerrainMap& map, TileRef start, int maxDepth,
                                        Passable&& passable, Match&& match)
    {
        assert(map.in_bounds(start));
        SearchScope scope(*this);
        prepare(map);
        _stats = {};

        if (match(start)) return start;

        const u32 width = static_cast<u32>(map.width());
        const u32 size  = map.size();

        _visited.mark(start);
        _stats.visited = 1;
        _current.clear();
        _current.push_back(start);

        for (int depth = 0; depth < maxDepth && !_current.empty(); ++depth) {
            _next.clear();
            TileRef best = kInvalidTile;

            for (const TileRef tile : _current) {
                for_each_cardinal(tile, width, size, [&](TileRef n) {
                    if (!_visited.visit(n)) return;
                    ++_stats.visited;
                    if (match(n) && (best == kInvalidTile || n > best))
                        best = n;
                    if (passable(n))
                        _next.push_back(n);
                });
            }

            _stats.depth = depth + 1;
            if (best != kInvalidTile) return best;
            _current.swap(_next);
        }
        return std::nullopt;
    }

    // Nearest tile owned by `player`, travelling only through lake and shore tiles.
    std::optional<TileRef> find_owned_lake_shore(const TerrainMap& map, TileRef start,
                                                 PlayerId player, int maxDepth)
    {
        return find_nearest(map, start, maxDepth,
            [&map](TileRef t) { return map.is_lake(t) || map.is_shore(t); },
            [&map, player](TileRef t) { return map.owner(t) == player; });
    }

    // Nearest shore of any owner, travelling only through unowned tiles.
    std::optional<TileRef> find_closest_shore(const TerrainMap& map, TileRef start, int maxDepth)
    {
        return find_nearest(map, start, maxDepth,
            [&map](TileRef t) { return !map.has_owner(t); },
            [&map](TileRef t) { return map.is_shore(t); });
    }

    // Nearest member of `targets`, never stepping through land.
    std::optional<TileRef> find_closest_in_set(const TerrainMap& map, TileRef start,
                                               const TileSet& targets, int maxDepth)
    {
        _stats = {};
        if (targets.empty()) return std::nullopt;
        if (targets.count(start) != 0) return start;
        return find_nearest(map, start, maxDepth,
            [&map](TileRef t) { return !map.is_land(t); },
            [&targets](TileRef t) { return targets.count(t) != 0; });
    }

    [[nodiscard]] const BfsStats& last_search_stats() const noexcept { return _stats; }
    [[nodiscard]] const VisitedGenerations& visited() const noexcept { return _visited; }

private:
    struct SearchScope {
        explicit SearchScope(BfsEngine& e) : engine(e) {
            assert(!engine._inSearch && "BfsEngine searches are not reentrant");
            engine._inSearch = true;
        }
        ~SearchScope() { engine._inSearch = false; }
        SearchScope(const SearchScope&) = delete;
        SearchScope& operator=(const SearchScope&) = delete;
        BfsEngine& engine;
    };

    // Sizes the stamp buffer for `map` and opens a new generation.
    void prepare(const TerrainMap& map);

    VisitedGenerations   _visited;
    std::vector<TileRef> _current;
    std::vector<TileRef> _next;
    BfsStats _stats{};
    bool _inSearch{false};
};

} // namespace landfall::pf
