#pragma once

#include "agent.hpp"
#include "config.hpp"

namespace flock {

/**
 * @brief Per-agent motion update: speed clamp, soft boundary steering, then
 * explicit Euler.
 */
class Integrator {
  public:
    Integrator() = default;
    explicit Integrator(const FlockParams &params) : m_params(params) {}

    inline void set_params(const FlockParams &params) noexcept {
        m_params = params;
    }
    inline const FlockParams &params() const noexcept { return m_params; }

    /**
     * @brief Rescales the velocity so its length lies in
     * [min_speed, max_speed], keeping its direction.
     * @details A zero velocity has no direction; it becomes
     * (min_speed, 0).
     */
    void limit_speed(Agent &agent) const noexcept;

    /**
     * @brief Turns the agent back toward the steering box.
     * @details For each axis where |position| exceeds the bound, the
     * velocity component loses sign(position) * turn_speed * dt. Positions
     * are never clamped.
     */
    void keep_in_bounds(Agent &agent, float dt) const noexcept;

    /**
     * @brief limit_speed, keep_in_bounds, then position += velocity * dt.
     */
    void advance(Agent &agent, float dt) const noexcept;

  private:
    FlockParams m_params;
};

} // namespace flock
