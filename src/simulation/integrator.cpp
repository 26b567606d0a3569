#include "integrator.hpp"

#include <algorithm>
#include <cmath>

namespace flock {

void Integrator::limit_speed(Agent &agent) const noexcept {
    const float speed = length(agent.velocity);
    if (!(speed > 0.f)) {
        agent.velocity = {m_params.min_speed, 0.f};
        return;
    }

    const float clamped =
        std::clamp(speed, m_params.min_speed, m_params.max_speed);
    agent.velocity *= clamped / speed;
}

void Integrator::keep_in_bounds(Agent &agent, float dt) const noexcept {
    if (std::fabs(agent.position.x) > m_params.x_bound) {
        agent.velocity.x -= sign(agent.position.x) * m_params.turn_speed * dt;
    }
    if (std::fabs(agent.position.y) > m_params.y_bound) {
        agent.velocity.y -= sign(agent.position.y) * m_params.turn_speed * dt;
    }
}

void Integrator::advance(Agent &agent, float dt) const noexcept {
    limit_speed(agent);
    keep_in_bounds(agent, dt);
    agent.position += agent.velocity * dt;
}

} // namespace flock
