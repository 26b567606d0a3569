#include "simulation.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

using namespace std::chrono;

namespace flock {

namespace {

constexpr int kMaxTicksPerStep = 10000;

} // namespace

Simulation::Simulation()
    : m_pool(std::make_unique<SimulationThreadPool>(1)) {
    LOG_INFO("Creating simulation");
}

Simulation::~Simulation() { LOG_DEBUG("Destroying simulation"); }

void Simulation::initialize(const SimulationConfig &cfg) {
    validate_config(cfg);

    AgentStore seeded;
    seeded.seed_random(derive_params(cfg), cfg.population, cfg.seed);
    commit(cfg, std::move(seeded.live_mut()));
}

void Simulation::initialize(const SimulationConfig &cfg,
                            std::vector<Agent> agents) {
    validate_config(cfg);

    if ((int)agents.size() != cfg.population) {
        throw ConfigError(
            fmt::format("got {} agents for a population of {}",
                        agents.size(), cfg.population));
    }

    const GridLayout layout = derive_grid_layout(cfg);
    for (size_t i = 0; i < agents.size(); ++i) {
        if (!UniformGrid::fits(layout, agents[i].position)) {
            throw ConfigError(fmt::format(
                "agent {} starts at ({}, {}), outside the padded {} x {} grid",
                i, agents[i].position.x, agents[i].position.y, layout.dim_x,
                layout.dim_y));
        }
    }

    commit(cfg, std::move(agents));
}

void Simulation::commit(const SimulationConfig &cfg,
                        std::vector<Agent> agents) {
    const GridLayout layout = derive_grid_layout(cfg);

    ensure_pool(cfg);
    m_query.ensure(layout, cfg.population);

    m_config = cfg;
    m_params = derive_params(cfg);
    m_layout = layout;
    m_forces.set_params(m_params);
    m_integrator.set_params(m_params);
    m_store.assign(std::move(agents));

    m_num_steps = 0;
    m_last_step_ns = 0;
    m_run_state = RunState::Ready;

    LOG_INFO(fmt::format("Simulation ready: {} agents, {} x {} grid, {} threads",
                         m_store.size(), layout.dim_x, layout.dim_y,
                         m_pool->size()));
}

void Simulation::update_config(const SimulationConfig &cfg) {
    validate_config(cfg);

    if (m_run_state == RunState::Uninitialized ||
        !same_grid_layout(m_config, cfg)) {
        LOG_DEBUG("Grid layout or population changed, re-initializing");
        initialize(cfg);
        return;
    }

    ensure_pool(cfg);

    m_config = cfg;
    m_params = derive_params(cfg);
    m_forces.set_params(m_params);
    m_integrator.set_params(m_params);

    LOG_DEBUG("Applied simulation config without reseeding");
}

void Simulation::reset() {
    if (m_run_state == RunState::Uninitialized) {
        throw SimulationError("reset called before initialize");
    }

    LOG_INFO("Resetting simulation");
    initialize(m_config);
}

void Simulation::ensure_pool(const SimulationConfig &cfg) {
    const int desired = (cfg.sim_threads <= 0) ? compute_sim_threads()
                                               : std::max(1, cfg.sim_threads);
    if (!m_pool) {
        m_pool = std::make_unique<SimulationThreadPool>(desired);
    } else if (m_pool->size() != desired) {
        m_pool->resize(desired);
    }
}

void Simulation::step(float dt) {
    if (m_run_state == RunState::Uninitialized) {
        throw SimulationError("step called before initialize");
    }
    if (!std::isfinite(dt) || dt < 0.f) {
        throw SimulationError(fmt::format("Invalid time step: {}", dt));
    }

    const float scaled = dt * m_config.time_scale;
    const double needed = std::ceil(static_cast<double>(scaled) / kMaxTickDt);
    if (!(needed <= kMaxTicksPerStep)) {
        throw SimulationError(fmt::format(
            "Time step {} s (scaled {} s) needs more than {} ticks", dt,
            scaled, kMaxTicksPerStep));
    }
    const int ticks = std::max(1, static_cast<int>(needed));
    const float tick_dt = scaled / static_cast<float>(ticks);

    const auto start = steady_clock::now();
    m_run_state = RunState::Stepping;

    try {
        for (int t = 0; t < ticks; ++t) {
            tick(tick_dt);
        }
    } catch (const FlockException &e) {
        m_run_state = RunState::Ready;
        LOG_ERROR(fmt::format("Step {} failed: {}", m_num_steps, e.what()));
        throw;
    } catch (...) {
        m_run_state = RunState::Ready;
        throw;
    }

    m_run_state = RunState::Ready;
    ++m_num_steps;
    m_last_step_ns =
        duration_cast<nanoseconds>(steady_clock::now() - start).count();
}

void Simulation::tick(float dt) {
    const int count = m_store.size();
    m_query.ensure(m_layout, count);
    m_query.rebuild(m_store.live(), m_store.sorted_mut());

    KernelData data;
    data.dt = dt;
    data.sorted = &m_store.sorted();
    data.live = &m_store.live_mut();

    m_pool->parallel_for_n(
        [&](int s, int e) {
            kernel_update(s, e, data);
        },
        count);
}

void Simulation::kernel_update(int start, int end,
                               const KernelData &data) const {
    const std::vector<Agent> &sorted = *data.sorted;
    std::vector<Agent> &live = *data.live;

    for (int i = start; i < end; ++i) {
        Agent agent = sorted[i];

        const int cell = m_query.cell_of(agent);
        const NeighborWindow window = m_query.window(cell, sorted);
        const FlockingDeltas deltas = m_forces.compute(agent, window, data.dt);

        agent.velocity += deltas.total();
        m_integrator.advance(agent, data.dt);

        live[i] = agent;
    }
}

SimulationStats Simulation::get_stats() const noexcept {
    SimulationStats stats;
    stats.num_steps = m_num_steps;
    stats.last_step_ns = m_last_step_ns;
    stats.agents = m_store.size();
    stats.sim_threads = m_pool ? m_pool->size() : 0;
    stats.grid_cols = m_query.grid().cols();
    stats.grid_rows = m_query.grid().rows();
    return stats;
}

} // namespace flock
