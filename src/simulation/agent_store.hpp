#pragma once

#include <vector>

#include "agent.hpp"
#include "config.hpp"

namespace flock {

/**
 * @brief Owns the two agent buffers of the simulation.
 *
 * - @c live is the current state. The renderer reads it between ticks and
 *   every tick writes slot i of it exactly once.
 * - @c sorted is the frozen snapshot of the tick, ordered by grid cell.
 *   Neighbor reads only ever see this buffer.
 *
 * Both buffers always have the same length. Agents are identified by their
 * slot only; slots are reshuffled every tick.
 */
class AgentStore {
  public:
    AgentStore() = default;
    ~AgentStore() = default;
    AgentStore(const AgentStore &) = delete;
    AgentStore(AgentStore &&) = delete;
    AgentStore &operator=(const AgentStore &) = delete;
    AgentStore &operator=(AgentStore &&) = delete;

    /**
     * @brief Resizes both buffers to @p count zero-initialized agents.
     * @throws SimulationError if count is negative
     */
    void allocate(int count);

    /**
     * @brief Replaces the live buffer with @p agents; the snapshot takes the
     * same length.
     */
    void assign(std::vector<Agent> agents);

    /**
     * @brief Fills @p count agents with random positions inside the
     * steering box and random velocities in [-max_speed, max_speed]^2.
     * @param seed 0 draws a seed from std::random_device
     */
    void seed_random(const FlockParams &params, int count, unsigned int seed);

    /**
     * @brief Empties both buffers.
     * @param shrink Whether to shrink vectors to free memory
     */
    void reset(bool shrink = false);

    inline int size() const noexcept { return (int)m_live.size(); }
    inline bool empty() const noexcept { return m_live.empty(); }

    inline const std::vector<Agent> &live() const noexcept { return m_live; }
    inline std::vector<Agent> &live_mut() noexcept { return m_live; }

    inline const std::vector<Agent> &sorted() const noexcept {
        return m_sorted;
    }
    inline std::vector<Agent> &sorted_mut() noexcept { return m_sorted; }

  private:
    std::vector<Agent> m_live;   // current tick state
    std::vector<Agent> m_sorted; // cell-ordered snapshot
};

} // namespace flock
