#include "multicore.hpp"

#include <fmt/format.h>

namespace flock {

SimulationThreadPool::SimulationThreadPool(int threads) { start(threads); }

SimulationThreadPool::~SimulationThreadPool() { stop(); }

void SimulationThreadPool::resize(int threads) {
    const int wanted = threads <= 0 ? compute_sim_threads() : threads;
    if (wanted == size()) {
        return;
    }
    LOG_DEBUG(fmt::format("Resizing sim pool {} -> {}", size(), wanted));
    stop();
    start(wanted);
}

void SimulationThreadPool::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queue.push(std::move(job));
    }
    m_queue_signal.notify_one();
}

void SimulationThreadPool::start(int threads) {
    if (!m_workers.empty()) {
        throw SimulationError("Thread pool already started");
    }

    const int count = std::max(1, threads <= 0 ? compute_sim_threads() : threads);
    LOG_DEBUG(fmt::format("Starting sim pool with {} workers", count));

    m_stopping = false;
    m_workers.reserve(count);
    for (int i = 0; i < count; ++i) {
        m_workers.emplace_back(&SimulationThreadPool::worker_loop, this);
    }
}

void SimulationThreadPool::stop() {
    if (m_workers.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_stopping = true;
    }
    m_queue_signal.notify_all();

    for (std::thread &worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
    m_queue = {};
}

void SimulationThreadPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_signal.wait(lock,
                                [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                // only reached while stopping
                return;
            }
            job = std::move(m_queue.front());
            m_queue.pop();
        }
        job();
    }
}

} // namespace flock
