/**
 * @file ResolveWorkerPool.cpp
 * @brief Implementation of ResolveWorkerPool.
 */

#include "application/ResolveWorkerPool.hpp"

namespace casegraph::application {

ResolveWorkerPool::ResolveWorkerPool(size_t workers) : m_running(true) {
    if (workers == 0) workers = 1;
    m_workers.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back(&ResolveWorkerPool::workerLoop, this);
    }
}

ResolveWorkerPool::~ResolveWorkerPool() {
    stop();
}

void ResolveWorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) worker.join();
    }
}

void ResolveWorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // packaged_task stores any exception in its future.
        task();
    }
}

} // namespace casegraph::application
