#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "simulation/integrator.hpp"

using namespace flock;
using Catch::Approx;

namespace {

// min_speed 1.5, max_speed 2, turn_speed 6, steering box 5 x 4
FlockParams motion_params() {
    SimulationConfig cfg;
    cfg.max_speed = 2.f;
    cfg.min_speed_ratio = 0.75f;
    cfg.turn_speed_ratio = 3.f;
    cfg.bounds_x = 5.5f;
    cfg.bounds_y = 4.5f;
    cfg.edge_margin = 0.5f;
    return derive_params(cfg);
}

} // namespace

TEST_CASE("Integrator clamps speed keeping direction", "[integrator]") {
    Integrator integ(motion_params());

    SECTION("Too fast") {
        Agent a{{0.f, 0.f}, {3.f, 4.f}};
        integ.limit_speed(a);
        REQUIRE(length(a.velocity) == Approx(2.f));
        REQUIRE(a.velocity.x == Approx(1.2f));
        REQUIRE(a.velocity.y == Approx(1.6f));
    }

    SECTION("Too slow") {
        Agent a{{0.f, 0.f}, {0.f, -0.5f}};
        integ.limit_speed(a);
        REQUIRE(a.velocity.x == Approx(0.f));
        REQUIRE(a.velocity.y == Approx(-1.5f));
    }

    SECTION("In range is untouched") {
        Agent a{{0.f, 0.f}, {0.f, 1.8f}};
        integ.limit_speed(a);
        REQUIRE(a.velocity.y == Approx(1.8f));
    }

    SECTION("Zero velocity picks +x at min speed") {
        Agent a{{0.f, 0.f}, {0.f, 0.f}};
        integ.limit_speed(a);
        REQUIRE(a.velocity == Vec2{1.5f, 0.f});
    }
}

TEST_CASE("Integrator steers back toward the box", "[integrator]") {
    Integrator integ(motion_params());

    SECTION("Outside on +x") {
        Agent a{{6.f, 0.f}, {0.f, 1.8f}};
        integ.keep_in_bounds(a, 0.1f);
        REQUIRE(a.velocity.x == Approx(-0.6f));
        REQUIRE(a.velocity.y == Approx(1.8f));
        // Positions are never clamped
        REQUIRE(a.position.x == 6.f);
    }

    SECTION("Outside on -y") {
        Agent a{{0.f, -4.2f}, {1.f, -1.f}};
        integ.keep_in_bounds(a, 0.1f);
        REQUIRE(a.velocity.x == Approx(1.f));
        REQUIRE(a.velocity.y == Approx(-0.4f));
    }

    SECTION("Inside is untouched") {
        Agent a{{4.9f, -3.9f}, {1.f, -1.f}};
        integ.keep_in_bounds(a, 0.1f);
        REQUIRE(a.velocity == Vec2{1.f, -1.f});
    }
}

TEST_CASE("Integrator advance applies clamp, steering, then Euler",
          "[integrator]") {
    Integrator integ(motion_params());

    Agent a{{6.f, 0.f}, {0.f, 1.8f}};
    integ.advance(a, 0.1f);

    REQUIRE(a.velocity.x == Approx(-0.6f));
    REQUIRE(a.velocity.y == Approx(1.8f));
    REQUIRE(a.position.x == Approx(5.94f));
    REQUIRE(a.position.y == Approx(0.18f));
}

TEST_CASE("Integrator steering can leave speed outside the limits",
          "[integrator]") {
    Integrator integ(motion_params());

    // Clamp happens before steering, so the turn is applied on top
    Agent a{{6.f, 0.f}, {2.f, 0.f}};
    integ.advance(a, 0.1f);

    REQUIRE(a.velocity.x == Approx(1.4f));
    REQUIRE(a.velocity.y == Approx(0.f));
    REQUIRE(length(a.velocity) < 1.5f);
}
