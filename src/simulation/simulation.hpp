#pragma once

#include <memory>
#include <vector>

#include "agent.hpp"
#include "agent_store.hpp"
#include "config.hpp"
#include "flocking.hpp"
#include "integrator.hpp"
#include "multicore.hpp"
#include "neighborquery.hpp"

namespace flock {

/**
 * @brief Counters published after every tick.
 */
struct SimulationStats {
    long long num_steps = 0;
    long long last_step_ns = 0; // duration of the last step
    int agents = 0;
    int sim_threads = 0; // current worker count
    int grid_cols = 0;
    int grid_rows = 0;
};

/**
 * @brief Runs the flocking pipeline once per host tick.
 *
 * Every tick:
 *  1) counting-sort the live agents into the cell-ordered snapshot
 *  2) for each snapshot slot i, in parallel: resolve the cell, read the 3x3
 *     window from the snapshot, apply the flocking rules, clamp speed, steer
 *     back into the box, integrate, and write the result into live slot i
 *
 * All reads of one tick observe the same snapshot, so the result does not
 * depend on iteration order or on the number of worker threads.
 *
 * Not thread-safe; a single owner drives it.
 */
class Simulation {
  public:
    enum class RunState { Uninitialized, Ready, Stepping };

    Simulation();
    ~Simulation();
    Simulation(const Simulation &) = delete;
    Simulation(Simulation &&) = delete;
    Simulation &operator=(const Simulation &) = delete;
    Simulation &operator=(Simulation &&) = delete;

    /**
     * @brief Validates @p cfg, allocates the buffers and seeds random
     * agents.
     * @throws ConfigError if @p cfg is invalid; the previous state is kept
     */
    void initialize(const SimulationConfig &cfg);

    /**
     * @brief Validates @p cfg and starts from the given agents.
     * @throws ConfigError if @p cfg is invalid, if the agent count differs
     * from cfg.population or if an agent starts outside the padded grid;
     * the previous state is kept
     */
    void initialize(const SimulationConfig &cfg, std::vector<Agent> agents);

    /**
     * @brief Applies a new configuration.
     * @details Changes that keep the grid layout and the population take
     * effect at the next tick without touching the agents. Anything else
     * re-initializes with random agents.
     * @throws ConfigError if @p cfg is invalid; the previous state is kept
     */
    void update_config(const SimulationConfig &cfg);

    /**
     * @brief Reseeds the agents with the current configuration.
     * @throws SimulationError if the simulation was never initialized
     */
    void reset();

    /**
     * @brief Advances every agent by @p dt * time_scale seconds, split into
     * equal ticks of at most kMaxTickDt.
     * @throws SimulationError if uninitialized or if @p dt is negative or
     * not finite
     * @throws ConfigError if an agent escaped the padded grid; the agents
     * are left as the last completed tick wrote them
     */
    void step(float dt);

    /**
     * @brief Read-only view of the current agents, valid until the next
     * call that mutates the simulation.
     */
    inline const std::vector<Agent> &agents() const noexcept {
        return m_store.live();
    }

    inline RunState get_run_state() const noexcept { return m_run_state; }
    inline const SimulationConfig &get_config() const noexcept {
        return m_config;
    }
    inline const FlockParams &get_params() const noexcept { return m_params; }
    inline const GridLayout &get_layout() const noexcept { return m_layout; }
    inline const UniformGrid &grid() const noexcept { return m_query.grid(); }

    SimulationStats get_stats() const noexcept;

  private:
    /**
     * @brief Per-tick constants shared by the kernel jobs
     */
    struct KernelData {
        float dt = 0.f;
        const std::vector<Agent> *sorted = nullptr;
        std::vector<Agent> *live = nullptr;
    };

    /**
     * @brief Commits a validated configuration and its initial agents
     */
    void commit(const SimulationConfig &cfg, std::vector<Agent> agents);

    /**
     * @brief Resizes the pool to the configured thread count
     */
    void ensure_pool(const SimulationConfig &cfg);

    /**
     * @brief One rebuild + per-agent pass over @p dt simulated seconds
     */
    void tick(float dt);

    /**
     * @brief Updates live[start..end) from snapshot[start..end)
     */
    void kernel_update(int start, int end, const KernelData &data) const;

  private:
    SimulationConfig m_config;
    FlockParams m_params;
    GridLayout m_layout;

    AgentStore m_store;
    NeighborQuery m_query;
    FlockingForceModel m_forces;
    Integrator m_integrator;

    std::unique_ptr<SimulationThreadPool> m_pool;

    RunState m_run_state{RunState::Uninitialized};
    long long m_num_steps = 0;
    long long m_last_step_ns = 0;
};

} // namespace flock
