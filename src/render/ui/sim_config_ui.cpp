#include "sim_config_ui.hpp"

#include <algorithm>
#include <thread>

#include "../../simulation/multicore.hpp"
#include "../../utility/default_config.hpp"
#include "../../utility/exceptions.hpp"
#include "../../utility/logger.hpp"

namespace flock {

void SimConfigUI::render(Context &ctx) {
    if (!ctx.rcfg.show_ui || !ctx.rcfg.show_sim_config)
        return;
    render_ui(ctx);
}

void SimConfigUI::apply(Context &ctx, const SimulationConfig &scfg) {
    try {
        ctx.sim.update_config(scfg);
        m_error.clear();
    } catch (const ConfigError &e) {
        LOG_WARN(std::string("Rejected configuration: ") + e.what());
        m_error = e.what();
    }
}

void SimConfigUI::render_ui(Context &ctx) {
    SimulationConfig scfg = ctx.sim.get_config();
    bool scfg_updated = false;

    ImGui::Begin("[F1] Simulation Configuration", &ctx.rcfg.show_sim_config);
    ImGui::SetWindowSize(ImVec2{420, 560}, ImGuiCond_FirstUseEver);

    render_playback_section(ctx);
    render_flocking_params(scfg, scfg_updated);
    render_parallelism_section(scfg, scfg_updated);
    render_layout_section(ctx);

    if (!m_error.empty()) {
        ImGui::Separator();
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4{1.f, 0.4f, 0.4f, 1.f});
        ImGui::TextWrapped("%s", m_error.c_str());
        ImGui::PopStyleColor();
    }

    ImGui::End();

    if (scfg_updated) {
        apply(ctx, scfg);
    }
}

void SimConfigUI::render_playback_section(Context &ctx) {
    ImGui::SeparatorText("Playback");

    if (ImGui::Button(ctx.playback.paused ? "Resume" : "Pause")) {
        ctx.playback.paused = !ctx.playback.paused;
    }
    ImGui::SameLine();
    if (!ctx.playback.paused)
        ImGui::BeginDisabled();
    if (ImGui::Button("Step")) {
        ctx.playback.step_once = true;
    }
    if (!ctx.playback.paused)
        ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        try {
            ctx.sim.reset();
        } catch (const FlockException &e) {
            LOG_WARN(std::string("Reset failed: ") + e.what());
            m_error = e.what();
        }
    }

    ImGui::SliderFloat("Max frame dt", &ctx.rcfg.max_frame_dt, 1.f / 240.f,
                       0.25f, "%.4f s", ImGuiSliderFlags_Logarithmic);
}

void SimConfigUI::render_flocking_params(SimulationConfig &scfg,
                                         bool &scfg_updated) {
    ImGui::SeparatorText("Flocking");

    if (ImGui::SliderFloat("Cohesion", &scfg.cohesion_factor, 0.0f, 10.0f,
                           "%.2f")) {
        scfg_updated = true;
    }
    if (ImGui::SliderFloat("Separation", &scfg.separation_factor, 0.0f, 10.0f,
                           "%.2f")) {
        scfg_updated = true;
    }
    if (ImGui::SliderFloat("Alignment", &scfg.alignment_factor, 0.0f, 10.0f,
                           "%.2f")) {
        scfg_updated = true;
    }
    if (ImGui::SliderFloat("Min distance", &scfg.min_distance, 0.0f,
                           scfg.visual_range, "%.3f")) {
        scfg_updated = true;
    }

    ImGui::SeparatorText("Motion");

    if (ImGui::SliderFloat("Max speed", &scfg.max_speed, 0.1f, 10.0f, "%.2f",
                           ImGuiSliderFlags_AlwaysClamp)) {
        scfg_updated = true;
    }
    if (ImGui::SliderFloat("Min speed ratio", &scfg.min_speed_ratio, 0.0f,
                           1.0f, "%.2f", ImGuiSliderFlags_AlwaysClamp)) {
        scfg_updated = true;
    }
    if (ImGui::SliderFloat("Turn speed ratio", &scfg.turn_speed_ratio, 0.1f,
                           10.0f, "%.2f", ImGuiSliderFlags_AlwaysClamp)) {
        scfg_updated = true;
    }
    if (ImGui::SliderFloat("Time Scale", &scfg.time_scale, 0.01f, 4.0f,
                           "%.3f", ImGuiSliderFlags_Logarithmic)) {
        scfg_updated = true;
    }
}

void SimConfigUI::render_layout_section(Context &ctx) {
    ImGui::SeparatorText("Population & Grid (restart)");

    struct LayoutUIState {
        bool inited = false;
        SimulationConfig pending;
    };
    static LayoutUIState ls;

    if (!ls.inited || ImGui::IsWindowAppearing()) {
        ls.pending = ctx.sim.get_config();
        ls.inited = true;
    }

    ImGui::SliderInt("Population", &ls.pending.population, 1, 50000, "%d",
                     ImGuiSliderFlags_Logarithmic);
    ImGui::SliderFloat("Visual range", &ls.pending.visual_range, 0.05f, 2.0f,
                       "%.3f");
    ImGui::SliderFloat("Edge margin", &ls.pending.edge_margin, 0.0f, 2.0f,
                       "%.2f");
    ImGui::SliderFloat("Half height", &ls.pending.bounds_y, 1.0f, 50.0f,
                       "%.1f");
    ImGui::SliderInt("Grid padding", &ls.pending.grid_padding,
                     kMinGridPadding, 64);
    int seed = (int)ls.pending.seed;
    if (ImGui::InputInt("Seed (0 = random)", &seed)) {
        ls.pending.seed = (unsigned int)std::max(0, seed);
    }
    ImGui::Checkbox("Fit bounds to window", &ctx.rcfg.fit_bounds_to_window);

    if (ImGui::Button("Apply & Restart")) {
        const SimulationConfig current = ctx.sim.get_config();
        SimulationConfig next = current;
        next.population = ls.pending.population;
        next.visual_range = ls.pending.visual_range;
        next.edge_margin = ls.pending.edge_margin;
        next.bounds_y = ls.pending.bounds_y;
        next.grid_padding = ls.pending.grid_padding;
        next.seed = ls.pending.seed;
        if (ctx.rcfg.fit_bounds_to_window) {
            utility::fit_bounds_to_aspect(next, ctx.wcfg.screen_width,
                                          ctx.wcfg.screen_height);
        }

        try {
            ctx.sim.initialize(next);
            m_error.clear();
        } catch (const ConfigError &e) {
            LOG_WARN(std::string("Rejected configuration: ") + e.what());
            m_error = e.what();
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Revert")) {
        ls.pending = ctx.sim.get_config();
    }
}

void SimConfigUI::render_parallelism_section(SimulationConfig &scfg,
                                             bool &scfg_updated) {
    ImGui::SeparatorText("Parallelism");

    unsigned hc = std::thread::hardware_concurrency();
    int max_threads = std::max(1, (int)hc - 2);
    ImGui::Text("HW threads: %u", hc ? hc : 1);

    bool auto_mode = (scfg.sim_threads <= 0);

    if (ImGui::Checkbox("Auto (HW-2)", &auto_mode)) {
        scfg.sim_threads = auto_mode ? -1 : 1;
        scfg_updated = true;
    }

    if (!auto_mode) {
        if (ImGui::SliderInt("Sim threads", &scfg.sim_threads, 1, max_threads,
                             "%d", ImGuiSliderFlags_AlwaysClamp)) {
            scfg_updated = true;
        }
    } else {
        ImGui::BeginDisabled();
        int auto_val = std::max(1, (int)compute_sim_threads());
        ImGui::SliderInt("Sim threads", &auto_val, 1, max_threads, "%d");
        ImGui::EndDisabled();
    }
}

} // namespace flock
