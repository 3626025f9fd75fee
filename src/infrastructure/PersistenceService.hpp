/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <future>
#include <cstdint>

namespace casegraph::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation and its completion signal.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::promise<bool> done;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All writes pass through a single serialized queue, so two writes to the same file
 * land in submission order and a reader never observes a half-written file.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Queues an atomic write (temp file, then rename).
     * @return Resolves to true once the rename succeeded, false on any failure.
     */
    std::future<bool> writeAtomic(const std::string& filename, const std::string& content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    uint64_t m_sequence = 0;
};

} // namespace casegraph::infrastructure
