#pragma once

#include <cmath>
#include <raylib.h>

namespace flock {

struct CameraState {
    float x = 0.0f; // world units
    float y = 0.0f;
    float zoom_log = 0.0f; // zoom = 2^zoom_log

    float zoom() const { return std::exp2f(zoom_log); }
};

struct Config {
    // ui
    bool show_ui = true;
    bool show_metrics_ui = false;
    bool show_sim_config = true;

    // boids
    Color background_color = {12, 14, 20, 255};
    Color boid_color = {235, 235, 240, 255};
    float boid_scale = 0.1f; // world units per triangle unit

    // overlays
    bool show_bounds = true;
    Color bounds_color = {90, 110, 160, 255};
    bool show_grid_lines = false; // debug cell grid
    bool show_velocity = false;
    float vel_scale = 0.1f; // world units per speed unit

    // frame
    bool fit_bounds_to_window = true;
    float max_frame_dt = 1.0f / 30.0f; // seconds

    // camera
    CameraState camera;
};

/**
 * @brief Host-side stepping controls, not persisted
 */
struct PlaybackState {
    bool paused = false;
    bool step_once = false;
};

} // namespace flock
