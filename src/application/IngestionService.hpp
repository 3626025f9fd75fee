/**
 * @file IngestionService.hpp
 * @brief Orchestrates cursor -> documents -> extraction -> batch commit.
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "application/ModeController.hpp"
#include "domain/ExtractionSupplier.hpp"
#include "domain/SourceDocument.hpp"

namespace casegraph::application {

/**
 * @class IngestionService
 * @brief Feeds the next cursor window of a corpus through the extraction supplier and the Mode Controller.
 */
class IngestionService {
public:
    IngestionService(std::shared_ptr<domain::DocumentSource> source,
                     std::shared_ptr<domain::ExtractionSupplier> supplier,
                     ModeController& controller,
                     size_t batchSize,
                     size_t contextTopK = 20);

    /**
     * @brief Result of an ingestion step.
     */
    struct IngestionResult {
        size_t batches = 0;
        size_t documentsProcessed = 0;
        size_t extractionFailures = 0;
        bool committed = false;
        bool exhausted = false;
        domain::MergeReport report;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    /**
     * @brief Processes the next batch_size documents after the cursor.
     * Documents whose extraction fails are listed in errors and still covered by the batch.
     * @param statusCallback Progress feedback.
     */
    IngestionResult ingestNextBatch(std::function<void(std::string)> statusCallback = nullptr,
                                    const std::atomic<bool>* cancelled = nullptr);

    /**
     * @brief Repeats ingestNextBatch until the corpus is exhausted, a batch fails, or @p maxBatches ran.
     * @param maxBatches Zero means no limit.
     */
    IngestionResult ingestPending(std::function<void(std::string)> statusCallback = nullptr,
                                  size_t maxBatches = 0,
                                  const std::atomic<bool>* cancelled = nullptr);

    /** @brief Ontology summary plus open questions, as handed to the supplier. */
    std::string extractionContext() const;

private:
    std::shared_ptr<domain::DocumentSource> m_source;
    std::shared_ptr<domain::ExtractionSupplier> m_supplier;
    ModeController& m_controller;
    size_t m_batchSize;
    size_t m_contextTopK;
};

} // namespace casegraph::application
