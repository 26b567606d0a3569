#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

#include "simulation/neighborquery.hpp"
#include "utility/exceptions.hpp"

using namespace flock;

namespace {

Agent tagged(float x, float y, int tag) {
    return Agent{{x, y}, {(float)tag, 0.f}};
}

std::vector<int> window_tags(const NeighborWindow &w) {
    std::vector<int> tags;
    w.for_each([&tags](const Agent &a) {
        tags.push_back((int)a.velocity.x);
    });
    std::sort(tags.begin(), tags.end());
    return tags;
}

// One agent at the centre of every interior cell of an 8x8 unit grid,
// tagged with its cell id.
std::vector<Agent> one_per_cell() {
    std::vector<Agent> agents;
    for (int cy = 1; cy <= 6; ++cy) {
        for (int cx = 1; cx <= 6; ++cx) {
            const float x = (float)cx - 4.f + 0.5f;
            const float y = (float)cy - 4.f + 0.5f;
            agents.push_back(tagged(x, y, 8 * cy + cx));
        }
    }
    return agents;
}

} // namespace

TEST_CASE("NeighborQuery window covers exactly the 3x3 block",
          "[neighborquery]") {
    NeighborQuery query;
    std::vector<Agent> live = one_per_cell();
    std::vector<Agent> sorted;

    query.ensure(GridLayout{1.f, 8, 8}, (int)live.size());
    query.rebuild(live, sorted);

    SECTION("Centre cell") {
        const int c = 8 * 3 + 3;
        const NeighborWindow w = query.window(c, sorted);
        REQUIRE(w.size() == 9);
        const std::vector<int> expected = {18, 19, 20, 26, 27,
                                           28, 34, 35, 36};
        REQUIRE(window_tags(w) == expected);
    }

    SECTION("Edge cell only sees the populated part of its block") {
        const int c = 8 * 1 + 1;
        const NeighborWindow w = query.window(c, sorted);
        const std::vector<int> expected = {9, 10, 17, 18};
        REQUIRE(window_tags(w) == expected);
    }

    SECTION("Ranges are contiguous row bands") {
        const int c = 8 * 4 + 2;
        const auto r = query.ranges(c);
        for (int k = 0; k < 3; ++k) {
            const int row = c + (k - 1) * 8;
            REQUIRE(r[k].begin == query.grid().cell_begin(row - 1));
            REQUIRE(r[k].end == query.grid().cell_end(row + 1));
            REQUIRE(r[k].size() == 3);
        }
    }
}

TEST_CASE("NeighborQuery window follows agents sharing a cell",
          "[neighborquery]") {
    NeighborQuery query;
    std::vector<Agent> live = {
        tagged(0.1f, 0.1f, 1), tagged(0.2f, 0.3f, 2), // cell (4,4)
        tagged(1.5f, 1.5f, 3),                        // cell (5,5)
        tagged(2.5f, 0.2f, 4),                        // cell (6,4), too far
    };
    std::vector<Agent> sorted;

    query.ensure(GridLayout{1.f, 8, 8}, (int)live.size());
    query.rebuild(live, sorted);

    const int c = query.cell_of(live[0]);
    REQUIRE(c == 8 * 4 + 4);

    const std::vector<int> expected = {1, 2, 3};
    REQUIRE(window_tags(query.window(c, sorted)) == expected);
}

TEST_CASE("NeighborQuery rejects cells without a full window",
          "[neighborquery]") {
    NeighborQuery query;
    std::vector<Agent> live = {tagged(0.f, 0.f, 0)};
    std::vector<Agent> sorted;

    query.ensure(GridLayout{1.f, 8, 8}, 1);
    query.rebuild(live, sorted);

    REQUIRE_THROWS_AS(query.ranges(0), SimulationError);
    REQUIRE_THROWS_AS(query.ranges(8 * 7 + 3), SimulationError);
    REQUIRE_THROWS_AS(query.cell_of(tagged(10.f, 0.f, 0)), ConfigError);
}

TEST_CASE("NeighborQuery only resizes when the layout changes",
          "[neighborquery]") {
    NeighborQuery query;

    query.ensure(GridLayout{1.f, 8, 8}, 4);
    REQUIRE(query.grid().cols() == 8);
    REQUIRE(query.grid().item_cells().size() == 4);

    query.ensure(GridLayout{0.5f, 12, 10}, 4);
    REQUIRE(query.grid().cols() == 12);
    REQUIRE(query.grid().rows() == 10);
    REQUIRE(query.grid().cell_size() == 0.5f);

    query.ensure(GridLayout{0.5f, 12, 10}, 6);
    REQUIRE(query.grid().item_cells().size() == 6);
}
