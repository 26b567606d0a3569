#include "boids_renderer.hpp"

#include <algorithm>
#include <cmath>

namespace flock {

namespace {

// Boid outline in local space, +y along the velocity
constexpr Vec2 kTriangle[3] = {{-0.4f, -0.5f}, {0.0f, 0.5f}, {0.4f, -0.5f}};

} // namespace

BoidsRenderer::BoidsRenderer(const WindowConfig &wcfg) : m_wcfg(wcfg) {}

void BoidsRenderer::resize(const WindowConfig &wcfg) { m_wcfg = wcfg; }

float BoidsRenderer::pixels_per_unit(const Context &ctx) const {
    const SimulationConfig &scfg = ctx.sim.get_config();
    const float fit_x = (float)m_wcfg.screen_width / (2.f * scfg.bounds_x);
    const float fit_y = (float)m_wcfg.screen_height / (2.f * scfg.bounds_y);
    return std::min(fit_x, fit_y) * ctx.rcfg.camera.zoom();
}

BoidsRenderer::CameraTransform
BoidsRenderer::setup_camera_transform(const Context &ctx) const {
    return {(float)m_wcfg.screen_width * 0.5f,
            (float)m_wcfg.screen_height * 0.5f, ctx.rcfg.camera.x,
            ctx.rcfg.camera.y, pixels_per_unit(ctx)};
}

void BoidsRenderer::render_bounds(const Context &ctx,
                                  const CameraTransform &t) const {
    const FlockParams &params = ctx.sim.get_params();
    const Vector2 top_left = to_screen(t, {-params.x_bound, params.y_bound});
    const Vector2 bottom_right =
        to_screen(t, {params.x_bound, -params.y_bound});
    DrawRectangleLinesEx({top_left.x, top_left.y, bottom_right.x - top_left.x,
                          bottom_right.y - top_left.y},
                         1.0f, ctx.rcfg.bounds_color);
}

void BoidsRenderer::render_grid_lines(const Context &ctx,
                                      const CameraTransform &t) const {
    const UniformGrid &grid = ctx.sim.grid();
    if (grid.empty()) {
        return;
    }

    const Color grid_color = ColorWithA(WHITE, 30);
    const float cell = grid.cell_size();
    // cell cx spans [(cx - cols/2) * cell, (cx - cols/2 + 1) * cell)
    const float x0 = -(float)(grid.cols() / 2) * cell;
    const float y0 = -(float)(grid.rows() / 2) * cell;
    const float x1 = x0 + (float)grid.cols() * cell;
    const float y1 = y0 + (float)grid.rows() * cell;

    for (int cx = 0; cx <= grid.cols(); ++cx) {
        const float x = x0 + (float)cx * cell;
        DrawLineEx(to_screen(t, {x, y0}), to_screen(t, {x, y1}), 1.0f,
                   grid_color);
    }
    for (int cy = 0; cy <= grid.rows(); ++cy) {
        const float y = y0 + (float)cy * cell;
        DrawLineEx(to_screen(t, {x0, y}), to_screen(t, {x1, y}), 1.0f,
                   grid_color);
    }
}

void BoidsRenderer::render_boids(const Context &ctx,
                                 const CameraTransform &t) const {
    const auto &agents = ctx.sim.agents();
    const float scale = ctx.rcfg.boid_scale;
    const Color color = ctx.rcfg.boid_color;
    const Color vel_color = ColorWithA(ctx.rcfg.boid_color, 120);

    for (const Agent &agent : agents) {
        const float speed = length(agent.velocity);
        const Vec2 fwd =
            speed > 0.f ? agent.velocity / speed : Vec2{0.f, 1.f};
        const Vec2 right = {fwd.y, -fwd.x};

        Vector2 v[3];
        for (int k = 0; k < 3; ++k) {
            const Vec2 local = kTriangle[k];
            v[k] = to_screen(t, agent.position +
                                    (right * local.x + fwd * local.y) * scale);
        }
        // y flip makes the local order clockwise on screen
        DrawTriangle(v[1], v[0], v[2], color);

        if (ctx.rcfg.show_velocity) {
            DrawLineV(to_screen(t, agent.position),
                      to_screen(t, agent.position +
                                       agent.velocity * ctx.rcfg.vel_scale),
                      vel_color);
        }
    }
}

void BoidsRenderer::render(Context &ctx) {
    ClearBackground(ctx.rcfg.background_color);

    if (ctx.sim.get_run_state() == Simulation::RunState::Uninitialized) {
        return;
    }

    const auto transform = setup_camera_transform(ctx);

    if (ctx.rcfg.show_grid_lines) {
        render_grid_lines(ctx, transform);
    }
    if (ctx.rcfg.show_bounds) {
        render_bounds(ctx, transform);
    }
    render_boids(ctx, transform);
}

} // namespace flock
