#include "metrics_ui.hpp"

namespace flock {

void MetricsUI::render(Context &ctx) {
    if (!ctx.rcfg.show_ui || !ctx.rcfg.show_metrics_ui) {
        return;
    }
    render_ui(ctx);
}

void MetricsUI::render_ui(Context &ctx) {
    static History fps_buf{};
    static History step_buf{};
    static int head = 0;

    const int fps = GetFPS();
    const auto stats = ctx.sim.get_stats();
    fps_buf[head] = static_cast<float>(fps);
    step_buf[head] = static_cast<float>(stats.last_step_ns) / 1e6f;
    head = (head + 1) % kHistory;

    ImGui::Begin("[F2] metrics", &ctx.rcfg.show_metrics_ui);

    const float width = static_cast<float>(ctx.wcfg.screen_width) * 0.25f;
    const float height = static_cast<float>(ctx.wcfg.screen_height) * 0.30f;
    ImGui::SetWindowPos(
        ImVec2{10.f, static_cast<float>(ctx.wcfg.screen_height) * 0.66f},
        ImGuiCond_Appearing);
    ImGui::SetWindowSize(ImVec2{width, height}, ImGuiCond_Appearing);

    render_performance_section(fps_buf, step_buf, head, fps, stats);
    render_details_section(ctx, stats);
    render_camera_section(ctx);

    ImGui::End();
}

void MetricsUI::render_performance_section(const History &fps_buf,
                                           const History &step_buf, int head,
                                           int fps,
                                           const SimulationStats &stats) {
    ImGui::SeparatorText("Performance");

    struct PlotCtx {
        const History *arr;
        int headIdx;
    };

    auto plot_circ = [](const History &buf, int start, float scale_max,
                        const char *label) {
        PlotCtx ctx{&buf, start};
        ImGui::PlotLines(
            label,
            [](void *data, int idx) {
                auto *ctx = static_cast<PlotCtx *>(data);
                const auto &arr = *ctx->arr;
                const int headIdx = ctx->headIdx;
                const int N = static_cast<int>(arr.size());
                return arr[(headIdx + idx) % N];
            },
            static_cast<void *>(&ctx), static_cast<int>(buf.size()), 0, nullptr,
            0.0f, scale_max, ImVec2(-1, 44));
    };

    ImGui::Text("FPS: %d", fps);
    plot_circ(fps_buf, head, 240.0f, "##fps_plot");
    ImGui::Text("Step: %.3f ms", stats.last_step_ns / 1e6);
    plot_circ(step_buf, head, 16.0f, "##step_plot");
}

void MetricsUI::render_details_section(Context &ctx,
                                       const SimulationStats &stats) {
    ImGui::SeparatorText("Details");
    ImGui::Text("Num steps: %lld", stats.num_steps);
    ImGui::Text("Agents: %d  Threads: %d", stats.agents, stats.sim_threads);
    ImGui::Text("Grid: %d x %d cells", stats.grid_cols, stats.grid_rows);
    const auto &scfg = ctx.sim.get_config();
    ImGui::Text("Bounds: %.2f x %.2f", scfg.bounds_x * 2.f,
                scfg.bounds_y * 2.f);
    ImGui::Text("State: %s", ctx.playback.paused ? "paused" : "running");
}

void MetricsUI::render_camera_section(Context &ctx) {
    ImGui::SeparatorText("Camera");
    ImGui::Text("Position: %.2f, %.2f", ctx.rcfg.camera.x, ctx.rcfg.camera.y);
    ImGui::SameLine();
    if (ImGui::Button("Center")) {
        ctx.rcfg.camera.x = 0.0f;
        ctx.rcfg.camera.y = 0.0f;
    }
    ImGui::Text("Zoom: %.2fx (log: %.2f)", ctx.rcfg.camera.zoom(),
                ctx.rcfg.camera.zoom_log);
    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        ctx.rcfg.camera.zoom_log = 0.0f;
    }
}

} // namespace flock
