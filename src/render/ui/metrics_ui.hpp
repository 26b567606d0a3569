#pragma once

#include <array>

#include <imgui.h>
#include <raylib.h>

#include "../irenderer.hpp"
#include "../types/config.hpp"

namespace flock {

/**
 * @brief UI component for displaying performance metrics and debug information
 */
class MetricsUI : public IRenderer {
  public:
    MetricsUI() = default;
    ~MetricsUI() override = default;
    MetricsUI(const MetricsUI &) = delete;
    MetricsUI &operator=(const MetricsUI &) = delete;
    MetricsUI(MetricsUI &&) = delete;
    MetricsUI &operator=(MetricsUI &&) = delete;

    /**
     * @brief Renders the metrics UI if enabled
     * @param ctx Rendering context containing configuration and simulation data
     */
    void render(Context &ctx) override;

  private:
    static constexpr int kHistory = 240;
    using History = std::array<float, kHistory>;

    void render_ui(Context &ctx);
    void render_performance_section(const History &fps_buf,
                                    const History &step_buf, int head, int fps,
                                    const SimulationStats &stats);
    void render_details_section(Context &ctx, const SimulationStats &stats);
    void render_camera_section(Context &ctx);
};

} // namespace flock
