/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace casegraph::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

std::future<bool> PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    SaveTask task{filename, content, std::promise<bool>()};
    std::future<bool> result = task.done.get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Write refused after stop: " << filename << std::endl;
            task.done.set_value(false);
            return result;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return result;
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            ++m_sequence;
        }

        // Process outside lock
        task.done.set_value(performAtomicWrite(task));
    }
}

bool PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path: filename.<timestamp>.<sequence>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(m_sequence) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace casegraph::infrastructure
