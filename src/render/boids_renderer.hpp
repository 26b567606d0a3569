#pragma once

#include <raylib.h>

#include "../simulation/agent.hpp"
#include "irenderer.hpp"
#include "types/config.hpp"
#include "types/window.hpp"

namespace flock {

/**
 * @brief Draws the flock: one triangle per agent oriented along its
 * velocity, plus optional steering-box, grid and velocity overlays.
 *
 * World space is y-up and centred on the origin; the camera maps it onto
 * the window so the simulation bounds fit at zoom 1.
 */
class BoidsRenderer : public IRenderer {
  public:
    explicit BoidsRenderer(const WindowConfig &wcfg);
    ~BoidsRenderer() override = default;
    BoidsRenderer(const BoidsRenderer &) = delete;
    BoidsRenderer(BoidsRenderer &&) = delete;
    BoidsRenderer &operator=(const BoidsRenderer &) = delete;
    BoidsRenderer &operator=(BoidsRenderer &&) = delete;

    /**
     * @brief Updates the viewport after a window resize
     * @param wcfg New window configuration
     */
    void resize(const WindowConfig &wcfg);

    /**
     * @brief Draws the current agents. Must be called between
     * BeginDrawing and EndDrawing.
     * @param ctx Rendering context containing simulation data and configuration
     */
    void render(Context &ctx) override;

    /**
     * @brief Pixels per world unit at the current camera zoom
     */
    float pixels_per_unit(const Context &ctx) const;

  private:
    /**
     * @brief Camera transformation data for rendering
     */
    struct CameraTransform {
        float center_x; // screen centre
        float center_y;
        float cam_x; // world point shown at the centre
        float cam_y;
        float ppu; // pixels per world unit
    };

    static inline Color ColorWithA(Color c, unsigned char a) {
        c.a = a;
        return c;
    }

    static inline Vector2 to_screen(const CameraTransform &t, Vec2 p) {
        return {t.center_x + (p.x - t.cam_x) * t.ppu,
                t.center_y - (p.y - t.cam_y) * t.ppu};
    }

    CameraTransform setup_camera_transform(const Context &ctx) const;

    void render_bounds(const Context &ctx, const CameraTransform &t) const;
    void render_grid_lines(const Context &ctx, const CameraTransform &t) const;
    void render_boids(const Context &ctx, const CameraTransform &t) const;

  private:
    WindowConfig m_wcfg;
};

} // namespace flock
