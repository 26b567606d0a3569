#include "keys.hpp"

#include "utility/logger.hpp"

namespace flock {

void setup_keys(KeyManager &key_manager, Simulation &sim, Config &rcfg,
                PlaybackState &playback, SaveManager &save_manager,
                RenderManager &rman, bool &should_exit) {
    // File operations
    key_manager.on_key_pressed(
        KEY_O, "Open project",
        [&rman, &sim, &rcfg, &playback, &save_manager]() {
            auto ctx = rman.make_context(sim, rcfg, playback, save_manager);
            rman.get_menu_bar().trigger_open_project(ctx);
        },
        KeyManager::Ctrl);

    key_manager.on_key_pressed(
        KEY_S, "Save project",
        [&rman, &sim, &rcfg, &playback, &save_manager]() {
            auto ctx = rman.make_context(sim, rcfg, playback, save_manager);
            rman.get_menu_bar().trigger_save_project(ctx);
        },
        KeyManager::Ctrl);

    key_manager.on_key_pressed(KEY_ESCAPE, "Quit", [&should_exit]() {
        should_exit = true;
    });

    // Simulation controls
    key_manager.on_key_pressed(KEY_R, "Reset flock", [&sim]() {
        LOG_DEBUG("Reset requested");
        sim.reset();
    });

    key_manager.on_key_pressed(KEY_SPACE, "Pause / resume", [&playback]() {
        playback.paused = !playback.paused;
    });

    key_manager.on_key_pressed(KEY_N, "Single step (paused)", [&playback]() {
        if (playback.paused) {
            playback.step_once = true;
        }
    });

    key_manager.on_key_repeat(KEY_N, "Single step (held)", [&playback]() {
        if (playback.paused) {
            playback.step_once = true;
        }
    });

    // UI toggles
    key_manager.on_key_pressed(KEY_TAB, "Toggle UI", [&rcfg]() {
        rcfg.show_ui = !rcfg.show_ui;
    });

    key_manager.on_key_pressed(KEY_F1, "Simulation config", [&rcfg]() {
        rcfg.show_sim_config = !rcfg.show_sim_config;
    });

    key_manager.on_key_pressed(KEY_F2, "Metrics", [&rcfg]() {
        rcfg.show_metrics_ui = !rcfg.show_metrics_ui;
    });

    key_manager.on_key_pressed(KEY_G, "Grid lines", [&rcfg]() {
        rcfg.show_grid_lines = !rcfg.show_grid_lines;
    });

    key_manager.on_key_pressed(KEY_B, "Steering box", [&rcfg]() {
        rcfg.show_bounds = !rcfg.show_bounds;
    });

    // Camera controls, in world units per frame at zoom 1
    static const float pan_speed = 0.1f;
    key_manager.on_key_down(KEY_LEFT, "Pan left", [&rcfg]() {
        rcfg.camera.x -= pan_speed / rcfg.camera.zoom();
    });

    key_manager.on_key_down(KEY_RIGHT, "Pan right", [&rcfg]() {
        rcfg.camera.x += pan_speed / rcfg.camera.zoom();
    });

    key_manager.on_key_down(KEY_UP, "Pan up", [&rcfg]() {
        rcfg.camera.y += pan_speed / rcfg.camera.zoom();
    });

    key_manager.on_key_down(KEY_DOWN, "Pan down", [&rcfg]() {
        rcfg.camera.y -= pan_speed / rcfg.camera.zoom();
    });

    rman.get_menu_bar().set_shortcuts(key_manager.bindings());
}

} // namespace flock
