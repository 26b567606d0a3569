#pragma once

namespace flock {

/**
 * @brief Minimum number of padding cells per grid axis. Half lands on each
 * side of the steering box; three cells per side keep the neighbor window of
 * every in-box position inside the offset table.
 */
constexpr int kMinGridPadding = 6;

/** @brief Upper bound on dim_x * dim_y. */
constexpr long long kMaxGridCells = 1LL << 24;

/**
 * @brief Longest simulated interval covered by one tick (seconds). Longer
 * steps are split into equal ticks no longer than this.
 */
constexpr float kMaxTickDt = 0.1f;

/**
 * @brief Multiplier on the braking distance max_speed^2 / turn_speed. An
 * agent held at min_speed while heading straight out turns slower than one
 * that brakes freely.
 */
constexpr float kTurnDistanceFactor = 4.f;

/**
 * @brief User-facing simulation parameters, validated once by
 * Simulation::initialize.
 */
struct SimulationConfig {
    int population = 200;

    float max_speed = 2.f;
    /** @brief minSpeed = max_speed * min_speed_ratio */
    float min_speed_ratio = 0.75f;
    /** @brief turnSpeed = max_speed * turn_speed_ratio */
    float turn_speed_ratio = 3.f;

    /** @brief Shrinks the steering box inside bounds_x / bounds_y */
    float edge_margin = 0.5f;
    /** @brief Neighbor radius and grid cell size */
    float visual_range = 0.5f;
    /** @brief Separation threshold */
    float min_distance = 0.15f;

    float cohesion_factor = 2.f;
    float separation_factor = 1.f;
    float alignment_factor = 5.f;

    /** @brief Half-extents of the visible area (world units) */
    float bounds_x = 5.f * 16.f / 9.f;
    float bounds_y = 5.f;

    /** @brief Extra cells per grid axis, split between both sides */
    int grid_padding = 30;

    float time_scale = 1.f;
    /** @brief -1 or 0 = automatic (hardware threads - 2) */
    int sim_threads = 1;
    /** @brief 0 = nondeterministic seeding */
    unsigned int seed = 0;
};

/**
 * @brief Derived constants consumed by the force model and the integrator.
 */
struct FlockParams {
    float visual_range_sq = 0.f;
    float min_distance_sq = 0.f;
    float cohesion_factor = 0.f;
    float separation_factor = 0.f;
    float alignment_factor = 0.f;
    float min_speed = 0.f;
    float max_speed = 0.f;
    float turn_speed = 0.f;
    /** @brief Steering box half-extents */
    float x_bound = 0.f;
    float y_bound = 0.f;
};

/**
 * @brief Shape of the flattened, row-major uniform grid.
 * @details Cell ids are `dim_x * cy + cx`; rows are contiguous, which the
 * neighbor query relies on to read three adjacent cells as one range.
 */
struct GridLayout {
    float cell_size = 1.f;
    int dim_x = 0;
    int dim_y = 0;

    inline int total_cells() const noexcept { return dim_x * dim_y; }

    bool operator==(const GridLayout &) const = default;
};

/**
 * @brief Checks every field of @p cfg, then that the padded grid leaves
 * room for steering_overshoot() on every side of the steering box.
 * @throws ConfigError naming the first invalid field
 */
void validate_config(const SimulationConfig &cfg);

/**
 * @brief Derives per-tick constants (squared radii, speed limits, steering
 * box) from @p cfg. Does not validate.
 */
FlockParams derive_params(const SimulationConfig &cfg);

/**
 * @brief Derives the padded grid covering the steering box of @p cfg.
 * Does not validate.
 */
GridLayout derive_grid_layout(const SimulationConfig &cfg);

/**
 * @brief Farthest an agent can travel past the steering box before the
 * boundary steering brings it back: kTurnDistanceFactor * max_speed^2 /
 * turn_speed plus two ticks of travel at max_speed.
 * @details Infinite when turn_speed_ratio is 0. Does not validate.
 */
float steering_overshoot(const SimulationConfig &cfg);

/**
 * @brief Distance from the steering box to the nearest edge of the interior
 * cells of @p layout, over all four sides.
 */
float grid_clearance(const SimulationConfig &cfg, const GridLayout &layout);

/**
 * @brief True if @p a and @p b produce the same grid and population, i.e.
 * switching between them does not require reallocating or reseeding.
 */
bool same_grid_layout(const SimulationConfig &a, const SimulationConfig &b);

} // namespace flock
