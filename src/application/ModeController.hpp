/**
 * @file ModeController.hpp
 * @brief Production vs. calibration commit semantics around one merge engine.
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/WorkspaceStore.hpp"
#include "domain/IngestionCursor.hpp"
#include "domain/WorkspacePersister.hpp"

namespace casegraph::application {

/**
 * @enum RunMode
 */
enum class RunMode {
    Production,   ///< Snapshot and cursor are persisted after every committed batch.
    Calibration   ///< Same decisions, nothing written; results discarded at the end of the run.
};

std::string RunModeToString(RunMode mode);

/**
 * @struct BatchResult
 */
struct BatchResult {
    bool committed = false;
    domain::MergeReport report;
    domain::IngestionCursor cursor;        ///< Cursor after the batch (unchanged if not committed).
    std::vector<std::string> errors;       ///< Why the batch was not committed.
    std::vector<std::string> warnings;     ///< Committed, but something non-fatal went wrong.
};

/**
 * @class ModeController
 * @brief Owns the store for the duration of a run and decides what becomes durable.
 *
 * Both modes go through the same WorkspaceStore; only the persist capability differs.
 * In production a batch counts as committed once its snapshot write is confirmed; a failed
 * snapshot write restores the pre-batch workspace and leaves the cursor where it was.
 */
class ModeController {
public:
    /**
     * @param workspace State loaded from the durable snapshot (or a fresh one).
     * @param persister Durable capability; ignored in calibration, which always uses a no-op one.
     * @param cursor Position read at process start.
     */
    ModeController(RunMode mode,
                   domain::Workspace workspace,
                   domain::EntityResolver resolver,
                   std::shared_ptr<domain::WorkspacePersister> persister,
                   domain::IngestionCursor cursor,
                   size_t resolveWorkers = 4);
    ~ModeController();

    /**
     * @brief Resolves, applies and (in production) persists one batch.
     * @throws domain::ConcurrentBatchError if called while another batch is in flight.
     */
    BatchResult processBatch(const domain::ExtractionBatch& batch, const std::atomic<bool>* cancelled = nullptr);

    /** @brief Updates the known corpus size (kept on the cursor). */
    void setTotalDocuments(size_t total);

    /** @brief Ends the run; later batches are refused. Calibration logs that its results are discarded. */
    void finish();

    RunMode mode() const { return m_mode; }
    const domain::IngestionCursor& cursor() const { return m_cursor; }
    const WorkspaceStore& store() const { return *m_store; }

private:
    RunMode m_mode;
    std::unique_ptr<WorkspaceStore> m_store;
    std::shared_ptr<domain::WorkspacePersister> m_persister;
    domain::IngestionCursor m_cursor;
    size_t m_batchesCommitted = 0;
    bool m_finished = false;
    std::mutex m_mutex;
};

} // namespace casegraph::application
