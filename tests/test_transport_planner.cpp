// tests/test_transport_planner.cpp
//
// Landing-shore and launch-point decisions on small hand-drawn maps.
// Legend: '.' land, '~' ocean, '-' lake, digits are land owned by that player.

#include <doctest/doctest.h>

#include "landfall/game/Roster.hpp"
#include "landfall/transport/TransportPlanner.hpp"

#include <algorithm>
#include <set>
#include <utility>

using namespace landfall;
using landfall::pf::TileRef;
using landfall::transport::BuildRejection;
using landfall::transport::UnitType;

namespace landfall_planner_test {

game::Roster make_roster(const char* ascii, transport::TransportConfig cfg = {}) {
    auto m = pf::GridMap::from_ascii(ascii);
    REQUIRE(m.has_value());
    return game::Roster(std::move(*m), cfg);
}

const transport::PlayerView& player(const game::Roster& r, pf::PlayerId id) {
    const auto* p = r.player(id);
    REQUIRE(p != nullptr);
    return *p;
}

// Two coastal players facing each other across open water.
constexpr const char* kTwoCoasts =
    "~~~~~~~~\n"
    "~~~~~~~~\n"
    "11....22\n"
    "11....22\n";

// Two players on opposite sides of an inland lake.
constexpr const char* kSharedLake =
    ".........\n"
    ".1-----2.\n"
    ".1-----2.\n"
    ".........\n";

// Ocean on the left, lake on the right, a three tile land bridge between.
constexpr const char* kLakeAndOcean =
    "~~~~........\n"
    "~~~~........\n"
    "~~~~...---..\n"
    "~~~~...---..\n"
    "~~~~...---..\n"
    "~~~~........\n"
    "~~~~........\n";

} // namespace landfall_planner_test

using namespace landfall_planner_test;

TEST_CASE("TransportPlanner/TargetTileFindsEnemyShoreNextToClickedWater") {
    auto r = make_roster(
        "~~~~~~\n"
        "~~~~~~\n"
        "......\n"
        "......\n");
    const auto& map = r.map();
    const TileRef shore = map.ref(3, 2);
    r.conquer(2, shore);
    REQUIRE(map.owner(shore) == 2);

    transport::TransportPlanner planner;
    CHECK(planner.target_transport_tile(r, map.ref(3, 1)) == shore);
}

TEST_CASE("TransportPlanner/TargetTileOnOwnedShoreResolvesToThatShore") {
    auto r = make_roster(kTwoCoasts);
    const auto& map = r.map();
    transport::TransportPlanner planner;

    CHECK(planner.target_transport_tile(r, map.ref(6, 2)) == map.ref(6, 2));
}

TEST_CASE("TransportPlanner/TargetTileOnNeutralWaterHonoursDepth") {
    transport::TransportConfig cfg;
    cfg.terraNulliusSearchDepth = 1;
    auto r = make_roster(
        "~~~~~~~\n"
        "~~~~~~~\n"
        "~~~~~~~\n"
        ".......\n", cfg);
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.target_transport_tile(r, r.map().ref(3, 0)).has_value());
    CHECK(planner.target_transport_tile(r, r.map().ref(3, 2)) == r.map().ref(3, 3));
}

TEST_CASE("TransportPlanner/ClosestShoreFromPlayerFollowsWater") {
    auto r = make_roster(
        "~~~~~~\n"
        "~~~~~~\n"
        "......\n");
    const auto& map = r.map();
    const TileRef shore = map.ref(2, 2);
    r.conquer(1, shore);

    transport::TransportPlanner planner;
    CHECK(planner.closest_shore_from_player(map, player(r, 1), map.ref(2, 1)) == shore);
}

TEST_CASE("TransportPlanner/ClosestShoreFromPlayerWithoutShoresIsEmpty") {
    auto r = make_roster(
        "~~~~~~\n"
        "......\n"
        "..11..\n"
        "......\n");
    transport::TransportPlanner planner;
    CHECK_FALSE(planner.closest_shore_from_player(r.map(), player(r, 1), r.map().ref(2, 0)).has_value());
}

TEST_CASE("TransportPlanner/ResolveSpawnRequiresShoreTarget") {
    auto r = make_roster(kTwoCoasts);
    const auto& map = r.map();
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.resolve_transport_spawn(r, player(r, 1), map.ref(3, 3)).has_value()); // inland
    CHECK_FALSE(planner.resolve_transport_spawn(r, player(r, 1), map.ref(3, 1)).has_value()); // water
    CHECK(planner.resolve_transport_spawn(r, player(r, 1), map.ref(6, 2)) == map.ref(1, 2));
}

TEST_CASE("TransportPlanner/CanBuildOceanTransport") {
    auto r = make_roster(kTwoCoasts);
    const auto& map = r.map();
    transport::TransportPlanner planner;

    const auto spawn = planner.can_build_transport_ship(r, player(r, 1), map.ref(6, 2));
    REQUIRE(spawn.has_value());
    CHECK(*spawn == map.ref(1, 2));
    CHECK(planner.last_rejection() == BuildRejection::None);
}

TEST_CASE("TransportPlanner/CanBuildFailsAtUnitCap") {
    auto r = make_roster(kTwoCoasts);
    const auto& map = r.map();
    transport::TransportPlanner planner;
    const TileRef enemyShore = map.ref(6, 2);

    SUBCASE("count equals the cap") {
        r.find(1)->set_unit_count(UnitType::TransportShip, r.config().boatMaxNumber);
        CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), enemyShore).has_value());
        CHECK(planner.last_rejection() == BuildRejection::UnitCap);
    }
    SUBCASE("count above the cap") {
        r.find(1)->set_unit_count(UnitType::TransportShip, r.config().boatMaxNumber + 4);
        CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), enemyShore).has_value());
        CHECK(planner.last_rejection() == BuildRejection::UnitCap);
    }
    SUBCASE("zero cap rejects a fleet of zero") {
        r.mutable_config().boatMaxNumber = 0;
        CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), enemyShore).has_value());
        CHECK(planner.last_rejection() == BuildRejection::UnitCap);
    }
    SUBCASE("one below the cap is allowed") {
        r.find(1)->set_unit_count(UnitType::TransportShip, r.config().boatMaxNumber - 1);
        CHECK(planner.can_build_transport_ship(r, player(r, 1), enemyShore).has_value());
    }
}

TEST_CASE("TransportPlanner/CanBuildRejectsOwnTerritory") {
    auto r = make_roster(kTwoCoasts);
    transport::TransportPlanner planner;
    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(1, 2)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::OwnTerritory);
}

TEST_CASE("TransportPlanner/CanBuildRespectsDiplomacy") {
    auto r = make_roster(kTwoCoasts);
    r.find(1)->set_allied(2, true);
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(6, 2)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::NotAttackable);

    r.find(1)->set_allied(2, false);
    CHECK(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(6, 2)).has_value());
}

TEST_CASE("TransportPlanner/CanBuildWithoutReachableTarget") {
    transport::TransportConfig cfg;
    cfg.terraNulliusSearchDepth = 2;
    auto r = make_roster(
        "~~~~~~~~\n"
        "~~~~~~~~\n"
        "~~~~~~~~\n"
        "~~~~~~~~\n"
        "~~~~~~~~\n"
        "11......\n", cfg);
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(6, 0)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::NoTarget);
}

TEST_CASE("TransportPlanner/CanBuildOceanNeedsOceanBorder") {
    auto r = make_roster(
        "~~~~~~~~~\n"
        "~~~~~~~~~\n"
        ".......22\n"
        ".1-......\n"
        ".1-......\n");
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(7, 2)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::NoOceanAccess);
}

TEST_CASE("TransportPlanner/CanBuildLakeTransport") {
    auto r = make_roster(kSharedLake);
    const auto& map = r.map();
    transport::TransportPlanner planner;

    const auto spawn = planner.can_build_transport_ship(r, player(r, 1), map.ref(7, 1));
    REQUIRE(spawn.has_value());
    CHECK(*spawn == map.ref(1, 1));
    CHECK_FALSE(map.is_ocean_shore(*spawn));
}

TEST_CASE("TransportPlanner/CanBuildLakeNeedsOwnLakeShore") {
    auto r = make_roster(
        "1........\n"
        "..-----2.\n"
        "..-----2.\n"
        ".........\n");
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(7, 1)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::NoLakeAccess);
}

TEST_CASE("TransportPlanner/CanBuildLakeNeedsSpawnShore") {
    // Player 1 is reached across the lake, but only through an unowned shore:
    // its own tile is inland, so there is nowhere to launch from.
    auto r = make_roster(
        ".........\n"
        "1.-----2.\n"
        "..-----2.\n"
        ".........\n");
    const auto& map = r.map();
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), map.ref(7, 1)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::NoSpawnShore);
    CHECK_FALSE(map.is_shore(map.ref(0, 1)));
    // The lake search found (0,1) seven steps out; spawn resolution never searched.
    CHECK(planner.engine().last_search_stats().depth == 7);
}

TEST_CASE("TransportPlanner/CanBuildLakeRespectsLakeDepth") {
    transport::TransportConfig cfg;
    cfg.lakeSearchDepth = 3;
    auto r = make_roster(kSharedLake, cfg);
    transport::TransportPlanner planner;

    CHECK_FALSE(planner.can_build_transport_ship(r, player(r, 1), r.map().ref(7, 1)).has_value());
    CHECK(planner.last_rejection() == BuildRejection::NoLakeAccess);
}

TEST_CASE("TransportPlanner/SourceDstOceanShore") {
    auto r = make_roster(kTwoCoasts);
    const auto& map = r.map();
    transport::TransportPlanner planner;

    SUBCASE("neutral water") {
        const auto shores = planner.source_dst_ocean_shore(r, player(r, 1), map.ref(3, 0));
        CHECK(shores.first == map.ref(1, 2));
        CHECK(shores.second == map.ref(3, 2));
    }
    SUBCASE("enemy coast") {
        const auto shores = planner.source_dst_ocean_shore(r, player(r, 1), map.ref(6, 2));
        CHECK(shores.first == map.ref(1, 2));
        CHECK(shores.second == map.ref(6, 2));
    }
    SUBCASE("either side may be missing") {
        auto inland = make_roster(
            "~~~~~~\n"
            "......\n"
            "..11..\n"
            "......\n");
        const auto shores = planner.source_dst_ocean_shore(inland, player(inland, 1), inland.map().ref(5, 0));
        CHECK_FALSE(shores.first.has_value());
        CHECK(shores.second == inland.map().ref(5, 1));
    }
}

TEST_CASE("TransportPlanner/BestShoreDeploymentSource") {
    auto r = make_roster(kTwoCoasts);
    const auto& map = r.map();
    transport::TransportPlanner planner;

    CHECK(planner.best_shore_deployment_source(r, player(r, 1), map.ref(6, 2)) == map.ref(1, 2));

    auto inland = make_roster(
        "~~~~~~\n"
        "......\n"
        "..11..\n"
        "......\n");
    CHECK_FALSE(planner.best_shore_deployment_source(inland, player(inland, 1), inland.map().ref(2, 0)).has_value());
}

TEST_CASE("TransportPlanner/CandidateShoreTilesOrdering") {
    auto r = make_roster(
        "~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~\n"
        "111111111111111111111111111111\n"
        "..............................\n");
    const auto& map = r.map();
    transport::TransportPlanner planner;

    const auto tiles = planner.candidate_shore_tiles(r, player(r, 1), map.ref(15, 0));

    // nearest, minX, (minY == maxX == maxY), then stride-10 samples
    const std::vector<TileRef> expected{
        map.ref(15, 1), map.ref(0, 1), map.ref(29, 1), map.ref(10, 1), map.ref(20, 1),
    };
    CHECK(tiles == expected);
}

TEST_CASE("TransportPlanner/CandidateShoreTilesAreUnique") {
    auto r = make_roster(kLakeAndOcean);
    const auto& map = r.map();
    // A ragged coastline on both water bodies.
    for (int y = 0; y < 7; ++y) r.conquer(1, map.ref(4, y));
    for (int y = 2; y < 5; ++y) r.conquer(1, map.ref(6, y));
    for (int x = 7; x < 10; ++x) r.conquer(1, map.ref(x, 5));

    transport::TransportPlanner planner;
    const auto tiles = planner.candidate_shore_tiles(r, player(r, 1), map.ref(8, 3));
    REQUIRE_FALSE(tiles.empty());

    const std::set<TileRef> unique(tiles.begin(), tiles.end());
    CHECK(unique.size() == tiles.size());
    for (const TileRef t : tiles) {
        CHECK(map.is_shore(t));
        CHECK(map.owner(t) == 1);
    }
    // From inside the lake the nearest candidate is a lake shore.
    CHECK_FALSE(map.is_ocean_shore(tiles.front()));
}

TEST_CASE("TransportPlanner/CandidateShoreTilesEmptyWithoutShores") {
    auto r = make_roster(
        "~~~~~~\n"
        "......\n"
        "..11..\n"
        "......\n");
    transport::TransportPlanner planner;
    CHECK(planner.candidate_shore_tiles(r, player(r, 1), r.map().ref(2, 0)).empty());
}

TEST_CASE("TransportPlanner/LakeAndOceanNeverMix") {
    auto r = make_roster(kLakeAndOcean);
    const auto& map = r.map();
    r.conquer(2, map.ref(4, 3)); // ocean side
    r.conquer(2, map.ref(6, 3)); // lake side
    transport::TransportPlanner planner;

    SUBCASE("neutral clicks") {
        const auto fromOcean = planner.target_transport_tile(r, map.ref(1, 3));
        REQUIRE(fromOcean.has_value());
        CHECK(map.is_ocean_shore(*fromOcean));

        const auto fromLake = planner.target_transport_tile(r, map.ref(8, 3));
        REQUIRE(fromLake.has_value());
        CHECK_FALSE(map.is_ocean_shore(*fromLake));
    }
    SUBCASE("one player, shores on both bodies") {
        CHECK(planner.closest_shore_from_player(map, player(r, 2), map.ref(8, 3)) == map.ref(6, 3));
        CHECK(planner.closest_shore_from_player(map, player(r, 2), map.ref(2, 3)) == map.ref(4, 3));
    }
    SUBCASE("transport from the lake launches from the lake") {
        r.conquer(1, map.ref(10, 3));
        const auto spawn = planner.can_build_transport_ship(r, player(r, 1), map.ref(6, 3));
        REQUIRE(spawn.has_value());
        CHECK(*spawn == map.ref(10, 3));
        CHECK_FALSE(map.is_ocean_shore(*spawn));
    }
}
