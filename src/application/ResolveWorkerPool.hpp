/**
 * @file ResolveWorkerPool.hpp
 * @brief Bounded thread pool for the read-only resolve phase.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace casegraph::application {

/**
 * @class ResolveWorkerPool
 * @brief Fixed number of workers draining a FIFO queue of tasks.
 *
 * Tasks submitted here must not mutate shared state; results come back through futures.
 */
class ResolveWorkerPool {
public:
    explicit ResolveWorkerPool(size_t workers);
    ~ResolveWorkerPool();

    ResolveWorkerPool(const ResolveWorkerPool&) = delete;
    ResolveWorkerPool& operator=(const ResolveWorkerPool&) = delete;

    /**
     * @brief Queues a task.
     * @throws std::runtime_error if the pool was stopped.
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                throw std::runtime_error("ResolveWorkerPool is stopped");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return future;
    }

    /** @brief Finishes queued tasks, then joins the workers. */
    void stop();

    size_t size() const { return m_workers.size(); }

private:
    void workerLoop();

    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
};

} // namespace casegraph::application
