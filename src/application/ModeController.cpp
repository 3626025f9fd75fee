/**
 * @file ModeController.cpp
 * @brief Implementation of ModeController.
 */

#include "application/ModeController.hpp"
#include <algorithm>
#include <iostream>
#include "domain/Errors.hpp"

namespace casegraph::application {

using namespace casegraph::domain;

std::string RunModeToString(RunMode mode) {
    return mode == RunMode::Calibration ? "calibration" : "production";
}

ModeController::ModeController(RunMode mode,
                               Workspace workspace,
                               EntityResolver resolver,
                               std::shared_ptr<WorkspacePersister> persister,
                               IngestionCursor cursor,
                               size_t resolveWorkers)
    : m_mode(mode), m_cursor(std::move(cursor)) {
    if (m_cursor.domain.empty()) m_cursor.domain = workspace.domain();
    m_store = std::make_unique<WorkspaceStore>(std::move(workspace), std::move(resolver), resolveWorkers);

    if (m_mode == RunMode::Calibration || !persister) {
        m_persister = std::make_shared<NullWorkspacePersister>();
    } else {
        m_persister = std::move(persister);
    }
    if (m_mode == RunMode::Production && !m_persister->isDurable()) {
        std::cerr << "[ModeController] Production run without a durable persister for '" << m_cursor.domain
                  << "'; nothing will be saved" << std::endl;
    }
    std::cout << "[ModeController] " << RunModeToString(m_mode) << " run for '" << m_cursor.domain
              << "' starting at document " << m_cursor.lastCommittedIndex << std::endl;
}

ModeController::~ModeController() {
    finish();
}

void ModeController::setTotalDocuments(size_t total) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cursor.totalDocuments = total;
}

BatchResult ModeController::processBatch(const ExtractionBatch& batch, const std::atomic<bool>* cancelled) {
    std::unique_lock<std::mutex> lock(m_mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        throw ConcurrentBatchError(m_cursor.domain);
    }

    BatchResult result;
    result.cursor = m_cursor;

    if (m_finished) {
        result.errors.push_back("run already finished");
        return result;
    }
    if (batch.firstDocumentIndex > m_cursor.lastCommittedIndex) {
        result.errors.push_back("batch starts at document " + std::to_string(batch.firstDocumentIndex) +
                                " but the cursor is at " + std::to_string(m_cursor.lastCommittedIndex));
        std::cerr << "[ModeController] " << result.errors.back() << std::endl;
        return result;
    }

    Workspace before = m_store->workspace();

    try {
        result.report = m_store->appendBatch(batch, cancelled);
    } catch (const ConcurrentBatchError&) {
        throw;
    } catch (const std::exception& e) {
        // The store never replaced its committed state.
        result.errors.push_back(e.what());
        return result;
    }

    try {
        const std::string bytes = m_store->snapshot();
        if (!m_persister->persistSnapshot(m_cursor.domain, bytes)) {
            result.errors.push_back("snapshot write was not confirmed");
        }
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("snapshot write failed: ") + e.what());
    }

    if (!result.errors.empty()) {
        m_store->replaceWorkspace(std::move(before));
        std::cerr << "[ModeController] Rolled back batch at document " << batch.firstDocumentIndex << ": "
                  << result.errors.back() << std::endl;
        return result;
    }

    IngestionCursor next = m_cursor;
    next.lastCommittedIndex = std::max(m_cursor.lastCommittedIndex, batch.firstDocumentIndex + batch.documentCount);

    try {
        if (!m_persister->persistCursor(next)) {
            result.warnings.push_back("cursor write was not confirmed; the snapshot is the source of truth");
        }
    } catch (const std::exception& e) {
        result.warnings.push_back(std::string("cursor write failed: ") + e.what());
    }
    for (const auto& w : result.warnings) {
        std::cerr << "[ModeController] " << w << std::endl;
    }

    m_cursor = next;
    ++m_batchesCommitted;
    result.committed = true;
    result.cursor = m_cursor;

    if (m_mode == RunMode::Production) {
        std::cout << "[ModeController] Cursor for '" << m_cursor.domain << "' advanced to "
                  << m_cursor.lastCommittedIndex;
        if (m_cursor.totalDocuments) std::cout << "/" << m_cursor.totalDocuments;
        std::cout << std::endl;
    }
    return result;
}

void ModeController::finish() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_finished) return;
    m_finished = true;
    if (m_mode == RunMode::Calibration) {
        std::cout << "[ModeController] Calibration run for '" << m_cursor.domain << "' discarded after "
                  << m_batchesCommitted << " batch(es)" << std::endl;
    }
}

} // namespace casegraph::application
