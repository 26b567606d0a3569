#include "agent_store.hpp"

#include <random>
#include <utility>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace flock {

void AgentStore::allocate(int count) {
    if (count < 0) {
        throw SimulationError(fmt::format("Invalid agent count: {}", count));
    }

    LOG_DEBUG(fmt::format("Allocating {} agents", count));
    m_live.assign(count, Agent{});
    m_sorted.assign(count, Agent{});
}

void AgentStore::assign(std::vector<Agent> agents) {
    m_live = std::move(agents);
    m_sorted.assign(m_live.size(), Agent{});
}

void AgentStore::seed_random(const FlockParams &params, int count,
                             unsigned int seed) {
    allocate(count);

    std::mt19937 rng{seed != 0 ? seed : std::random_device{}()};
    std::uniform_real_distribution<float> rx(-params.x_bound, params.x_bound);
    std::uniform_real_distribution<float> ry(-params.y_bound, params.y_bound);
    std::uniform_real_distribution<float> rv(-params.max_speed,
                                             params.max_speed);

    for (Agent &agent : m_live) {
        agent.position = {rx(rng), ry(rng)};
        agent.velocity = {rv(rng), rv(rng)};
    }
}

void AgentStore::reset(bool shrink) {
    m_live.clear();
    m_sorted.clear();

    if (shrink) {
        std::vector<Agent>().swap(m_live);
        std::vector<Agent>().swap(m_sorted);
    }
}

} // namespace flock
