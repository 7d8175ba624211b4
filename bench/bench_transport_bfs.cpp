#include <benchmark/benchmark.h>
#include "landfall/game/Roster.hpp"
#include "landfall/pathfinding/BfsKernel.hpp"
#include "landfall/pathfinding/GridMap.hpp"
#include "landfall/transport/TransportPlanner.hpp"
#include <random>
#include <utility>

using namespace landfall;
using namespace landfall::pf;

// Random archipelago: ocean with scattered land, a lake carved into the middle.
static GridMap make_archipelago(int w, int h, double land, uint32_t seed = 1337) {
    GridMap m(w, h);
    m.fill(0, 0, w - 1, h - 1, Terrain::Ocean);
    std::mt19937 rng(seed);
    std::bernoulli_distribution is_land(land);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            if (is_land(rng)) m.set_terrain(x, y, Terrain::Land);
    m.fill(w / 2 - w / 8, h / 2 - h / 8, w / 2 + w / 8, h / 2 + h / 8, Terrain::Land);
    m.fill(w / 2 - w / 16, h / 2 - h / 16, w / 2 + w / 16, h / 2 + h / 16, Terrain::Lake);
    return m;
}

// Many short searches from consecutive tiles; the steady state must not allocate.
static void bench_closest_shore(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    const GridMap m = make_archipelago(w, w, 0.15);
    BfsEngine bfs;
    const TileRef center = m.size() / 2;
    TileRef i = 0;
    double visited = 0;
    for (auto _ : st) {
        const TileRef start = (center + i++) % m.size();
        auto hit = bfs.find_closest_shore(m, start, 50);
        benchmark::DoNotOptimize(hit);
        visited += bfs.last_search_stats().visited;
    }
    st.counters["visited/search"] = benchmark::Counter(visited, benchmark::Counter::kAvgIterations);
}
BENCHMARK(bench_closest_shore)->Arg(128)->Arg(512)->Arg(1024);

// Deep search over open water toward a single far target.
static void bench_closest_in_set_far(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    GridMap m(w, w);
    m.fill(0, 0, w - 1, w - 1, Terrain::Ocean);
    m.set_terrain(w - 1, w - 1, Terrain::Land);
    const TileSet target{m.ref(w - 1, w - 1)};
    BfsEngine bfs;
    for (auto _ : st) {
        auto hit = bfs.find_closest_in_set(m, 0, target, 10000);
        benchmark::DoNotOptimize(hit);
    }
    st.counters["depth"] = bfs.last_search_stats().depth;
    st.counters["visited"] = bfs.last_search_stats().visited;
}
BENCHMARK(bench_closest_in_set_far)->Arg(128)->Arg(512);

// Full build gate for a coastal player against an enemy across the sea.
static void bench_can_build(benchmark::State& st) {
    const int w = static_cast<int>(st.range(0));
    GridMap m(w, w);
    m.fill(0, 0, w - 1, w / 2, Terrain::Ocean);
    for (int x = 0; x < w / 4; ++x) m.set_owner(x, w / 2 + 1, 1);
    for (int x = w - w / 4; x < w; ++x) m.set_owner(x, w / 2 + 1, 2);
    game::Roster roster(std::move(m));
    const auto* player = roster.player(1);
    const TileRef click = roster.map().ref(w - 1, w / 2 + 1);
    transport::TransportPlanner planner;
    for (auto _ : st) {
        auto spawn = planner.can_build_transport_ship(roster, *player, click);
        benchmark::DoNotOptimize(spawn);
    }
}
BENCHMARK(bench_can_build)->Arg(128)->Arg(512);

BENCHMARK_MAIN();
