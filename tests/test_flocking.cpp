#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "simulation/flocking.hpp"

using namespace flock;
using Catch::Approx;

namespace {

FlockParams test_params() {
    SimulationConfig cfg;
    cfg.visual_range = 0.5f;
    cfg.min_distance = 0.15f;
    cfg.cohesion_factor = 2.f;
    cfg.separation_factor = 1.f;
    cfg.alignment_factor = 5.f;
    return derive_params(cfg);
}

} // namespace

TEST_CASE("Flocking isolated agent gets no steering", "[flocking]") {
    FlockingForceModel model(test_params());
    const Agent self{{0.f, 0.f}, {1.f, 0.5f}};
    const std::vector<Agent> others = {self, Agent{{2.f, 2.f}, {0.f, 1.f}}};

    const FlockingDeltas d = model.compute(self, others, 0.1f);

    REQUIRE(d.neighbors == 0);
    REQUIRE(d.cohesion == Vec2{});
    REQUIRE(d.alignment == Vec2{});
    REQUIRE(d.separation == Vec2{});
    REQUIRE(d.total() == Vec2{});
}

TEST_CASE("Flocking close pair repels and attracts", "[flocking]") {
    FlockingForceModel model(test_params());
    // min_distance / 2 apart, at rest
    const Agent a{{0.f, 0.f}, {0.f, 0.f}};
    const Agent b{{0.075f, 0.f}, {0.f, 0.f}};
    const std::vector<Agent> both = {a, b};

    const FlockingDeltas da = model.compute(a, both, 0.1f);
    const FlockingDeltas db = model.compute(b, both, 0.1f);

    REQUIRE(da.neighbors == 1);

    // close = diff / d2 = -0.075 / 0.005625
    REQUIRE(da.separation.x == Approx(-1.33333f).epsilon(1e-4));
    REQUIRE(da.separation.y == Approx(0.f));
    REQUIRE(db.separation.x == Approx(1.33333f).epsilon(1e-4));

    // (0.075 - 0) * 2 * 0.1
    REQUIRE(da.cohesion.x == Approx(0.015f));
    REQUIRE(db.cohesion.x == Approx(-0.015f));

    // Both at rest, nothing to align
    REQUIRE(da.alignment.x == Approx(0.f));
    REQUIRE(da.alignment.y == Approx(0.f));
}

TEST_CASE("Flocking alignment matches neighbor velocity", "[flocking]") {
    FlockingForceModel model(test_params());
    const Agent self{{0.f, 0.f}, {1.f, 0.f}};
    const std::vector<Agent> others = {
        Agent{{0.3f, 0.f}, {0.f, 2.f}},
        Agent{{-0.3f, 0.f}, {0.f, 0.f}},
    };

    const FlockingDeltas d = model.compute(self, others, 0.1f);

    REQUIRE(d.neighbors == 2);
    // avg velocity (0, 1); (avg - self) * 5 * 0.1
    REQUIRE(d.alignment.x == Approx(-0.5f));
    REQUIRE(d.alignment.y == Approx(0.5f));
    // centre of mass at the origin
    REQUIRE(d.cohesion.x == Approx(0.f).margin(1e-6));
    // both outside min_distance
    REQUIRE(d.separation == Vec2{});
}

TEST_CASE("Flocking alignment ignores the same tick's cohesion", "[flocking]") {
    FlockingForceModel model(test_params());
    const Agent self{{0.f, 0.f}, {1.f, 0.f}};
    const std::vector<Agent> others = {Agent{{0.3f, 0.f}, {0.f, 2.f}}};

    const FlockingDeltas d = model.compute(self, others, 0.1f);

    // 0.3 * 2 * 0.1
    REQUIRE(d.cohesion.x == Approx(0.06f));
    // ((0, 2) - (1, 0)) * 5 * 0.1, not measured from (1.06, 0)
    REQUIRE(d.alignment.x == Approx(-0.5f));
    REQUIRE(d.alignment.y == Approx(1.f));
    REQUIRE(d.total().x == Approx(0.06f - 0.5f));
}

TEST_CASE("Flocking visual range boundary is inclusive", "[flocking]") {
    SimulationConfig cfg;
    cfg.visual_range = 0.5f;
    cfg.min_distance = 0.1f;
    FlockingForceModel model(derive_params(cfg));

    const Agent self{{0.f, 0.f}, {1.f, 0.f}};
    const std::vector<Agent> edge = {Agent{{0.5f, 0.f}, {1.f, 0.f}}};
    const std::vector<Agent> beyond = {Agent{{0.5001f, 0.f}, {1.f, 0.f}}};

    REQUIRE(model.compute(self, edge, 0.1f).neighbors == 1);
    REQUIRE(model.compute(self, beyond, 0.1f).neighbors == 0);
}

TEST_CASE("Flocking coincident agents are skipped", "[flocking]") {
    FlockingForceModel model(test_params());
    const Agent self{{1.f, 1.f}, {0.f, 1.f}};
    const std::vector<Agent> same = {Agent{{1.f, 1.f}, {5.f, 5.f}}};

    const FlockingDeltas d = model.compute(self, same, 0.1f);
    REQUIRE(d.neighbors == 0);
    REQUIRE(d.total() == Vec2{});
}

TEST_CASE("Flocking zero time step yields zero deltas", "[flocking]") {
    FlockingForceModel model(test_params());
    const Agent a{{0.f, 0.f}, {1.f, 0.f}};
    const std::vector<Agent> others = {Agent{{0.05f, 0.05f}, {0.f, 1.f}}};

    const FlockingDeltas d = model.compute(a, others, 0.f);
    REQUIRE(d.neighbors == 1);
    REQUIRE(d.total() == Vec2{});
}

TEST_CASE("Flocking window and list evaluation agree", "[flocking]") {
    FlockingForceModel model(test_params());
    const std::vector<Agent> agents = {
        Agent{{0.f, 0.f}, {1.f, 0.f}},
        Agent{{0.1f, 0.05f}, {0.f, 1.f}},
        Agent{{-0.2f, 0.3f}, {-1.f, 0.5f}},
        Agent{{0.4f, -0.1f}, {0.5f, 0.5f}},
    };

    NeighborWindow w;
    const std::span<const Agent> all(agents);
    w.bands[0] = all.subspan(0, 1);
    w.bands[1] = all.subspan(1, 2);
    w.bands[2] = all.subspan(3, 1);

    const FlockingDeltas from_list = model.compute(agents[0], agents, 0.1f);
    const FlockingDeltas from_window = model.compute(agents[0], w, 0.1f);

    REQUIRE(from_list.neighbors == 3);
    REQUIRE(from_window.neighbors == 3);
    REQUIRE(from_list.total() == from_window.total());
}
