#pragma once

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <exception>
#include <functional>
#include <latch>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace flock {

using Job = std::function<void()>;

/**
 * @brief Callable over a half-open agent range [start, end).
 */
template <typename F>
concept Kernel = requires(F f, int a, int b) {
    { f(a, b) } -> std::same_as<void>;
};

/** @brief Below this many agents a kernel runs on the calling thread. */
constexpr int kMinParallelItems = 1024;

/**
 * @brief Hardware threads minus two (render thread and OS), at least 1.
 */
inline int compute_sim_threads() {
    const unsigned int hw = std::thread::hardware_concurrency();
    return hw <= 2 ? 1 : static_cast<int>(hw) - 2;
}

/**
 * @brief Fixed set of workers running the per-agent kernel.
 * @details parallel_for_n hands each worker one contiguous block of agents.
 * Blocks are disjoint, so the output is the same for any worker count.
 */
class SimulationThreadPool {
  public:
    /** @param threads worker count, <= 0 for compute_sim_threads() */
    explicit SimulationThreadPool(int threads = -1);
    ~SimulationThreadPool();

    SimulationThreadPool(const SimulationThreadPool &) = delete;
    SimulationThreadPool(SimulationThreadPool &&) = delete;
    SimulationThreadPool &operator=(const SimulationThreadPool &) = delete;
    SimulationThreadPool &operator=(SimulationThreadPool &&) = delete;

    /** @brief Restarts the workers if the count changes. */
    void resize(int threads);

    inline int size() const noexcept { return (int)m_workers.size(); }

    /**
     * @brief Runs @p fn over [0, n_agents) and blocks until it is done.
     * @details Rethrows the first exception a block raised, after every
     * block has finished.
     */
    template <Kernel F>
    void parallel_for_n(F fn, int n_agents) {
        if (n_agents <= 0) {
            return;
        }
        if (size() <= 1 || n_agents < kMinParallelItems) {
            fn(0, n_agents);
            return;
        }

        const int block = (n_agents + size() - 1) / size();
        const int n_blocks = (n_agents + block - 1) / block;

        std::latch done(n_blocks);
        BlockErrors errors;

        for (int b = 0; b < n_blocks; ++b) {
            const int first = b * block;
            const int last = std::min(n_agents, first + block);
            enqueue([first, last, &fn, &done, &errors] {
                try {
                    fn(first, last);
                } catch (...) {
                    errors.capture(std::current_exception());
                }
                done.count_down();
            });
        }

        done.wait();
        errors.rethrow_first();
    }

  private:
    /** @brief First exception raised by any block of one parallel_for_n. */
    struct BlockErrors {
        std::mutex mutex;
        std::exception_ptr first;

        void capture(std::exception_ptr e) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!first) {
                first = std::move(e);
            }
        }

        void rethrow_first() {
            if (first) {
                std::rethrow_exception(first);
            }
        }
    };

    /** @throws SimulationError if workers are already running */
    void start(int threads);
    void stop();
    void enqueue(Job job);
    void worker_loop();

  private:
    std::vector<std::thread> m_workers;

    std::mutex m_queue_mutex;
    std::condition_variable m_queue_signal;
    std::queue<Job> m_queue;
    bool m_stopping = false;
};

} // namespace flock
