#pragma once

#include <string>

#include <imgui.h>
#include <raylib.h>

#include "../irenderer.hpp"
#include "../types/window.hpp"

namespace flock {

/**
 * @brief UI component for simulation configuration
 * @details Flocking factors, speeds, time scale and threads apply live.
 * Population and the grid-shaping fields are edited on a pending copy and
 * only take effect through "Apply & Restart".
 */
class SimConfigUI : public IRenderer {
  public:
    SimConfigUI() = default;
    ~SimConfigUI() override = default;
    SimConfigUI(const SimConfigUI &) = delete;
    SimConfigUI &operator=(const SimConfigUI &) = delete;
    SimConfigUI(SimConfigUI &&) = delete;
    SimConfigUI &operator=(SimConfigUI &&) = delete;

    void render(Context &ctx) override;

  private:
    void render_ui(Context &ctx);
    void render_playback_section(Context &ctx);
    void render_flocking_params(SimulationConfig &scfg, bool &scfg_updated);
    void render_layout_section(Context &ctx);
    void render_parallelism_section(SimulationConfig &scfg,
                                    bool &scfg_updated);

    /**
     * @brief Applies @p scfg, keeping the error for display on failure
     */
    void apply(Context &ctx, const SimulationConfig &scfg);

    /** @brief Last configuration error, empty if the last apply succeeded */
    std::string m_error;
};

} // namespace flock
