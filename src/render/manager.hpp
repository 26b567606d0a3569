#pragma once

#include <raylib.h>
#include <rlImGui.h>

#include "../save_manager.hpp"
#include "boids_renderer.hpp"
#include "types/context.hpp"
#include "types/window.hpp"
#include "ui/menu_bar_ui.hpp"
#include "ui/metrics_ui.hpp"
#include "ui/sim_config_ui.hpp"

namespace flock {

// Orchestrates one frame: flock, then the ImGui panels.
class RenderManager {
  public:
    explicit RenderManager(const WindowConfig &wcfg)
        : m_wcfg(wcfg), m_boids(wcfg) {}

    ~RenderManager() = default;
    RenderManager(const RenderManager &) = delete;
    RenderManager &operator=(const RenderManager &) = delete;
    RenderManager(RenderManager &&) = delete;
    RenderManager &operator=(RenderManager &&) = delete;

    void resize(const WindowConfig &wcfg) {
        m_wcfg = wcfg;
        m_boids.resize(wcfg);
    }

    /**
     * @brief Draws one frame
     * @return true if the UI requested the application to exit
     */
    bool draw_frame(Simulation &sim, Config &rcfg, PlaybackState &playback,
                    SaveManager &save) {
        Context ctx{sim, rcfg, m_wcfg, playback, save};

        BeginDrawing();

        m_boids.render(ctx);

        rlImGuiBegin();
        {
            m_menu_bar.render(ctx);
            m_sim_config.render(ctx);
            m_metrics.render(ctx);
        }
        rlImGuiEnd();

        EndDrawing();

        return ctx.should_exit;
    }

    /**
     * @brief Context for actions triggered outside draw_frame (shortcuts)
     */
    Context make_context(Simulation &sim, Config &rcfg,
                         PlaybackState &playback, SaveManager &save) {
        return Context{sim, rcfg, m_wcfg, playback, save};
    }

    inline MenuBarUI &get_menu_bar() { return m_menu_bar; }
    inline const BoidsRenderer &get_boids() const { return m_boids; }

  private:
    WindowConfig m_wcfg;
    BoidsRenderer m_boids;
    MenuBarUI m_menu_bar;
    SimConfigUI m_sim_config;
    MetricsUI m_metrics;
};

} // namespace flock
