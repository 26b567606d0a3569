#include <algorithm>
#include <iostream>
#include <string>

#include <fmt/format.h>
#include <imgui.h>
#include <raylib.h>
#include <rlImGui.h>

#include "input/key_manager.hpp"
#include "input/keys.hpp"
#include "render/manager.hpp"
#include "render/types/config.hpp"
#include "render/types/context.hpp"
#include "render/types/window.hpp"
#include "save_manager.hpp"
#include "simulation/simulation.hpp"
#include "utility/default_config.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

using namespace flock;

namespace {

// Fixed step used by single stepping while paused
constexpr float kSingleStepDt = 1.0f / 60.0f;

void run() {
    Logger::set_level(Logger::INFO_LEVEL);
    LOG_INFO("Starting flock application");
    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);

    SaveManager save_manager;
    auto window_state = save_manager.load_window_state();
    std::string last_file = save_manager.get_last_opened_file();

    InitWindow(window_state.width, window_state.height, "Flock");
    if (!IsWindowReady()) {
        throw RenderError(fmt::format("Failed to open a {}x{} window",
                                      window_state.width,
                                      window_state.height));
    }

    WindowConfig wcfg = {GetScreenWidth(), GetScreenHeight()};
    Config rcfg;
    PlaybackState playback;

    if (window_state.x != 0 || window_state.y != 0) {
        SetWindowPosition(window_state.x, window_state.y);
    }

    SetTargetFPS(60);
    rlImGuiSetup(true);

    ImGui::GetIO().IniFilename = nullptr;

    Simulation sim;
    RenderManager rman(wcfg);

    KeyManager key_manager;
    bool should_exit = false;
    setup_keys(key_manager, sim, rcfg, playback, save_manager, rman,
               should_exit);

    // Try to load last project, otherwise start from the default flock
    bool loaded_project = false;
    if (!last_file.empty()) {
        auto ctx = rman.make_context(sim, rcfg, playback, save_manager);
        loaded_project = rman.get_menu_bar().open_file(ctx, last_file);
    }

    if (!loaded_project) {
        SimulationConfig scfg = utility::create_default_config();
        utility::fit_bounds_to_aspect(scfg, wcfg.screen_width,
                                      wcfg.screen_height);
        sim.initialize(scfg);
    }

    while (!WindowShouldClose()) {
        if (IsWindowResized()) {
            wcfg.screen_width = GetScreenWidth();
            wcfg.screen_height = GetScreenHeight();
            LOG_INFO(fmt::format("Window resized to {}x{}", wcfg.screen_width,
                                 wcfg.screen_height));
            rman.resize(wcfg);
        }

        if (!playback.paused || playback.step_once) {
            const float dt =
                playback.step_once
                    ? kSingleStepDt
                    : std::min(GetFrameTime(), rcfg.max_frame_dt);
            playback.step_once = false;
            try {
                sim.step(dt);
            } catch (const ConfigError &e) {
                // an agent left the padded grid; keep the last good frame
                LOG_ERROR(std::string("Step rejected: ") + e.what());
                playback.paused = true;
            }
        }

        if (rman.draw_frame(sim, rcfg, playback, save_manager))
            break;

        // Check ImGui capture state
        bool imgui_mouse_captured = false;
        bool imgui_keyboard_captured = false;
        if (rcfg.show_ui) {
            ImGuiIO &io = ImGui::GetIO();
            imgui_mouse_captured = io.WantCaptureMouse;
            imgui_keyboard_captured = io.WantCaptureKeyboard;
        }

        key_manager.process(imgui_keyboard_captured);

        if (should_exit) {
            break;
        }

        // Mouse drag pans in world units, y up
        if (!imgui_mouse_captured && IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
            auto ctx = rman.make_context(sim, rcfg, playback, save_manager);
            const float ppu = rman.get_boids().pixels_per_unit(ctx);
            if (ppu > 0.f) {
                Vector2 delta = GetMouseDelta();
                rcfg.camera.x -= delta.x / ppu;
                rcfg.camera.y += delta.y / ppu;
            }
        }

        // Mouse wheel zoom
        if (!imgui_mouse_captured) {
            float wheel = GetMouseWheelMove();
            if (wheel != 0) {
                const float zoom_scale = 0.1f * wheel;
                const float min_zoom_log = -3.0f; // 0.125x zoom
                const float max_zoom_log = 4.0f;  // 16x zoom
                rcfg.camera.zoom_log =
                    std::clamp(rcfg.camera.zoom_log + zoom_scale, min_zoom_log,
                               max_zoom_log);
            }
        }
    }

    SaveManager::WindowState current_state;
    current_state.width = GetScreenWidth();
    current_state.height = GetScreenHeight();
    current_state.x = (int)GetWindowPosition().x;
    current_state.y = (int)GetWindowPosition().y;
    save_manager.save_window_state(current_state);

    rlImGuiShutdown();
    CloseWindow();
}

} // namespace

int main() {
    try {
        run();
        LOG_INFO("Application shutting down normally");
        return 0;
    } catch (const FlockException &e) {
        LOG_ERROR("Flock error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
