#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <limits>
#include <vector>

#include "simulation/uniformgrid.hpp"
#include "utility/exceptions.hpp"

using namespace flock;

namespace {

// 8x8 grid of unit cells: x in [-3, 3) and y in [-3, 3) are interior
GridLayout small_layout() { return GridLayout{1.f, 8, 8}; }

Agent at(float x, float y, float tag = 0.f) {
    return Agent{{x, y}, {tag, 0.f}};
}

} // namespace

TEST_CASE("UniformGrid maps positions to row-major cell ids", "[uniformgrid]") {
    UniformGrid grid;
    grid.resize(small_layout(), 0);

    REQUIRE(grid.cols() == 8);
    REQUIRE(grid.rows() == 8);
    REQUIRE(grid.total_cells() == 64);

    int cx, cy;
    REQUIRE(grid.locate({0.f, 0.f}, cx, cy));
    REQUIRE(cx == 4);
    REQUIRE(cy == 4);
    REQUIRE(grid.cell_id_of({0.f, 0.f}) == 8 * 4 + 4);

    REQUIRE(grid.locate({-2.5f, 1.2f}, cx, cy));
    REQUIRE(cx == 1);
    REQUIRE(cy == 5);

    REQUIRE(grid.cell_index(1, 5) == 41);
    REQUIRE(grid.cell_index(-1, 0) == -1);
    REQUIRE(grid.cell_index(8, 0) == -1);
}

TEST_CASE("UniformGrid rejects border cells and non-finite positions",
          "[uniformgrid]") {
    UniformGrid grid;
    grid.resize(small_layout(), 0);

    // cx == 0 and cx == 7 are border cells
    REQUIRE(grid.cell_id_of({-3.5f, 0.f}) == -1);
    REQUIRE(grid.cell_id_of({3.f, 0.f}) == -1);
    REQUIRE(grid.cell_id_of({0.f, 3.2f}) == -1);
    REQUIRE(grid.cell_id_of({2.99f, -3.f}) >= 0);

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    REQUIRE(grid.cell_id_of({nan, 0.f}) == -1);
    REQUIRE(grid.cell_id_of({0.f, -inf}) == -1);

    REQUIRE(UniformGrid::fits(small_layout(), {2.99f, -3.f}));
    REQUIRE_FALSE(UniformGrid::fits(small_layout(), {3.f, 0.f}));
    REQUIRE_FALSE(UniformGrid::fits(small_layout(), {nan, nan}));

    REQUIRE(grid.is_interior(grid.cell_index(1, 1)));
    REQUIRE_FALSE(grid.is_interior(grid.cell_index(0, 4)));
    REQUIRE_FALSE(grid.is_interior(grid.cell_index(4, 7)));
    REQUIRE_FALSE(grid.is_interior(-1));
    REQUIRE_FALSE(grid.is_interior(64));
}

TEST_CASE("UniformGrid rebuild groups agents by cell", "[uniformgrid]") {
    UniformGrid grid;
    std::vector<Agent> live = {
        at(0.1f, 0.1f, 0.f),  // cell (4,4)
        at(-2.5f, 1.2f, 1.f), // cell (1,5)
        at(0.7f, 0.9f, 2.f),  // cell (4,4)
        at(2.2f, -2.9f, 3.f), // cell (6,1)
        at(0.5f, 0.5f, 4.f),  // cell (4,4)
    };
    std::vector<Agent> sorted;

    grid.resize(small_layout(), (int)live.size());
    grid.rebuild(live, sorted);

    REQUIRE(sorted.size() == live.size());

    const auto &offsets = grid.offsets();
    REQUIRE(offsets.back() == (int)live.size());
    REQUIRE(std::is_sorted(offsets.begin(), offsets.end()));

    const int center = grid.cell_index(4, 4);
    REQUIRE(grid.cell_count_at(center) == 3);
    REQUIRE(grid.cell_count_at(grid.cell_index(1, 5)) == 1);
    REQUIRE(grid.cell_count_at(grid.cell_index(6, 1)) == 1);
    REQUIRE(grid.cell_count_at(grid.cell_index(2, 2)) == 0);

    // Cells come out in id order: (6,1) < (4,4) < (1,5)
    REQUIRE(sorted[0].velocity.x == 3.f);
    REQUIRE(sorted[4].velocity.x == 1.f);

    // Within a cell the scatter reverses input order
    const int b = grid.cell_begin(center);
    REQUIRE(sorted[b + 0].velocity.x == 4.f);
    REQUIRE(sorted[b + 1].velocity.x == 2.f);
    REQUIRE(sorted[b + 2].velocity.x == 0.f);

    // Per-agent bookkeeping is indexed by input slot
    REQUIRE(grid.item_cells()[1] == grid.cell_index(1, 5));
    REQUIRE(grid.item_ranks()[0] == 0);
    REQUIRE(grid.item_ranks()[2] == 1);
    REQUIRE(grid.item_ranks()[4] == 2);
}

TEST_CASE("UniformGrid rebuild is deterministic and reusable",
          "[uniformgrid]") {
    UniformGrid grid;
    std::vector<Agent> live;
    for (int i = 0; i < 40; ++i) {
        const float x = -2.9f + 0.147f * (float)i;
        const float y = 2.9f - 0.131f * (float)i;
        live.push_back(at(x, y, (float)i));
    }

    grid.resize(small_layout(), (int)live.size());

    std::vector<Agent> first, second;
    grid.rebuild(live, first);
    const std::vector<int> offsets = grid.offsets();
    grid.rebuild(live, second);

    REQUIRE(first == second);
    REQUIRE(offsets == grid.offsets());

    // Every input agent appears exactly once
    std::vector<float> tags;
    for (const Agent &a : second) {
        tags.push_back(a.velocity.x);
    }
    std::sort(tags.begin(), tags.end());
    for (int i = 0; i < 40; ++i) {
        REQUIRE(tags[i] == (float)i);
    }
}

TEST_CASE("UniformGrid rebuild throws before writing when an agent escaped",
          "[uniformgrid]") {
    UniformGrid grid;
    std::vector<Agent> live = {at(0.f, 0.f, 1.f), at(3.5f, 0.f, 2.f)};
    std::vector<Agent> sorted = {at(9.f, 9.f, 7.f), at(9.f, 9.f, 8.f)};
    const std::vector<Agent> before = sorted;

    grid.resize(small_layout(), (int)live.size());
    REQUIRE_THROWS_AS(grid.rebuild(live, sorted), ConfigError);
    REQUIRE(sorted == before);
}

TEST_CASE("UniformGrid validates size and layout", "[uniformgrid]") {
    UniformGrid grid;
    std::vector<Agent> live = {at(0.f, 0.f)};
    std::vector<Agent> sorted;

    // Never sized
    REQUIRE_THROWS_AS(grid.rebuild(live, sorted), SimulationError);

    grid.resize(small_layout(), 2);
    REQUIRE_THROWS_AS(grid.rebuild(live, sorted), SimulationError);

    REQUIRE_THROWS_AS(grid.resize(GridLayout{0.f, 8, 8}, 1), ConfigError);
    REQUIRE_THROWS_AS(grid.resize(GridLayout{1.f, 2, 8}, 1), ConfigError);
    REQUIRE_THROWS_AS(grid.resize(small_layout(), -1), ConfigError);

    grid.reset();
    REQUIRE(grid.empty());
    REQUIRE(grid.cols() == 0);
}

TEST_CASE("UniformGrid handles an empty population", "[uniformgrid]") {
    UniformGrid grid;
    std::vector<Agent> live;
    std::vector<Agent> sorted;

    grid.resize(small_layout(), 0);
    REQUIRE_NOTHROW(grid.rebuild(live, sorted));
    REQUIRE(sorted.empty());
    REQUIRE(grid.offsets().back() == 0);
}
