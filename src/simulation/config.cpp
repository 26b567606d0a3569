#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace flock {

namespace {

void require_finite(float value, const char *name) {
    if (!std::isfinite(value)) {
        throw ConfigError(fmt::format("{} must be finite, got {}", name, value));
    }
}

void require_positive(float value, const char *name) {
    require_finite(value, name);
    if (value <= 0.f) {
        throw ConfigError(fmt::format("{} must be > 0, got {}", name, value));
    }
}

void require_non_negative(float value, const char *name) {
    require_finite(value, name);
    if (value < 0.f) {
        throw ConfigError(fmt::format("{} must be >= 0, got {}", name, value));
    }
}

// Interior cells along one axis are [1, dim - 2]; with the dim / 2 origin
// shift used by UniformGrid::locate they span
// [(1 - dim / 2) * cell, (dim - 1 - dim / 2) * cell).
float axis_clearance(float bound, float cell, int dim) {
    const float half = static_cast<float>(dim / 2);
    const float low = (half - 1.f) * cell - bound;
    const float high = (static_cast<float>(dim) - 1.f - half) * cell - bound;
    return std::min(low, high);
}

} // namespace

void validate_config(const SimulationConfig &cfg) {
    if (cfg.population <= 0) {
        throw ConfigError(
            fmt::format("population must be > 0, got {}", cfg.population));
    }

    require_positive(cfg.max_speed, "max_speed");
    require_non_negative(cfg.min_speed_ratio, "min_speed_ratio");
    if (cfg.min_speed_ratio > 1.f) {
        throw ConfigError(fmt::format("min_speed_ratio must be <= 1, got {}",
                                      cfg.min_speed_ratio));
    }
    // Zero would let agents that leave the box drift off the grid
    require_positive(cfg.turn_speed_ratio, "turn_speed_ratio");

    require_positive(cfg.visual_range, "visual_range");
    require_non_negative(cfg.min_distance, "min_distance");
    require_finite(cfg.cohesion_factor, "cohesion_factor");
    require_finite(cfg.separation_factor, "separation_factor");
    require_finite(cfg.alignment_factor, "alignment_factor");

    require_positive(cfg.bounds_x, "bounds_x");
    require_positive(cfg.bounds_y, "bounds_y");
    require_non_negative(cfg.edge_margin, "edge_margin");
    if (cfg.bounds_x - cfg.edge_margin <= 0.f ||
        cfg.bounds_y - cfg.edge_margin <= 0.f) {
        throw ConfigError(fmt::format(
            "edge_margin {} leaves no usable area inside bounds {} x {}",
            cfg.edge_margin, cfg.bounds_x, cfg.bounds_y));
    }

    require_non_negative(cfg.time_scale, "time_scale");

    if (cfg.sim_threads < -1) {
        throw ConfigError(
            fmt::format("Invalid thread count: {}", cfg.sim_threads));
    }

    if (cfg.grid_padding < kMinGridPadding) {
        throw ConfigError(
            fmt::format("grid_padding must be >= {} cells, got {}",
                        kMinGridPadding, cfg.grid_padding));
    }

    const float x_bound = cfg.bounds_x - cfg.edge_margin;
    const float y_bound = cfg.bounds_y - cfg.edge_margin;
    const double cols =
        std::floor(2.0 * x_bound / cfg.visual_range) + cfg.grid_padding;
    const double rows =
        std::floor(2.0 * y_bound / cfg.visual_range) + cfg.grid_padding;
    if (cols * rows > static_cast<double>(kMaxGridCells)) {
        throw ConfigError(fmt::format(
            "grid of {} x {} cells exceeds the {} cell limit; raise "
            "visual_range or shrink bounds",
            cols, rows, kMaxGridCells));
    }

    const GridLayout layout = derive_grid_layout(cfg);
    const float clearance = grid_clearance(cfg, layout);
    const float overshoot = steering_overshoot(cfg);
    if (!(clearance >= overshoot)) {
        throw ConfigError(fmt::format(
            "grid_padding {} leaves {:.3f} units around the steering box but "
            "agents at max_speed {} can overshoot it by {:.3f}; raise "
            "grid_padding or turn_speed_ratio",
            cfg.grid_padding, clearance, cfg.max_speed, overshoot));
    }
}

FlockParams derive_params(const SimulationConfig &cfg) {
    FlockParams p;
    p.visual_range_sq = cfg.visual_range * cfg.visual_range;
    p.min_distance_sq = cfg.min_distance * cfg.min_distance;
    p.cohesion_factor = cfg.cohesion_factor;
    p.separation_factor = cfg.separation_factor;
    p.alignment_factor = cfg.alignment_factor;
    p.max_speed = cfg.max_speed;
    p.min_speed = cfg.max_speed * cfg.min_speed_ratio;
    p.turn_speed = cfg.max_speed * cfg.turn_speed_ratio;
    p.x_bound = cfg.bounds_x - cfg.edge_margin;
    p.y_bound = cfg.bounds_y - cfg.edge_margin;
    return p;
}

GridLayout derive_grid_layout(const SimulationConfig &cfg) {
    const float x_bound = cfg.bounds_x - cfg.edge_margin;
    const float y_bound = cfg.bounds_y - cfg.edge_margin;

    GridLayout layout;
    layout.cell_size = cfg.visual_range;
    layout.dim_x = static_cast<int>(std::floor(x_bound * 2.f / cfg.visual_range)) +
                   cfg.grid_padding;
    layout.dim_y = static_cast<int>(std::floor(y_bound * 2.f / cfg.visual_range)) +
                   cfg.grid_padding;
    return layout;
}

float steering_overshoot(const SimulationConfig &cfg) {
    const float turn_speed = cfg.max_speed * cfg.turn_speed_ratio;
    if (!(turn_speed > 0.f)) {
        return std::numeric_limits<float>::infinity();
    }
    return kTurnDistanceFactor * cfg.max_speed * cfg.max_speed / turn_speed +
           2.f * cfg.max_speed * kMaxTickDt;
}

float grid_clearance(const SimulationConfig &cfg, const GridLayout &layout) {
    const float x_bound = cfg.bounds_x - cfg.edge_margin;
    const float y_bound = cfg.bounds_y - cfg.edge_margin;
    return std::min(axis_clearance(x_bound, layout.cell_size, layout.dim_x),
                    axis_clearance(y_bound, layout.cell_size, layout.dim_y));
}

bool same_grid_layout(const SimulationConfig &a, const SimulationConfig &b) {
    return a.population == b.population &&
           derive_grid_layout(a) == derive_grid_layout(b);
}

} // namespace flock
