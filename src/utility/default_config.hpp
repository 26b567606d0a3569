#pragma once

#include "../simulation/config.hpp"

namespace flock::utility {

/**
 * @brief Creates the default flock used throughout the application
 * @details 200 boids in a 16:9 view of half height 5.
 */
inline SimulationConfig create_default_config() {
    SimulationConfig cfg;
    cfg.population = 200;
    cfg.max_speed = 2.f;
    cfg.min_speed_ratio = 0.75f;
    cfg.turn_speed_ratio = 3.f;
    cfg.edge_margin = 0.5f;
    cfg.visual_range = 0.5f;
    cfg.min_distance = 0.15f;
    cfg.cohesion_factor = 2.f;
    cfg.separation_factor = 1.f;
    cfg.alignment_factor = 5.f;
    cfg.bounds_y = 5.f;
    cfg.bounds_x = cfg.bounds_y * 16.f / 9.f;
    cfg.grid_padding = 30;
    cfg.time_scale = 1.f;
    cfg.sim_threads = -1;
    cfg.seed = 0;
    return cfg;
}

/**
 * @brief Derives the horizontal half-extent from the viewport aspect,
 * keeping bounds_y.
 */
inline void fit_bounds_to_aspect(SimulationConfig &cfg, int width,
                                 int height) {
    if (width <= 0 || height <= 0) {
        return;
    }
    cfg.bounds_x = cfg.bounds_y * (float)width / (float)height;
}

} // namespace flock::utility
