/**
 * @file IngestionService.cpp
 * @brief Implementation of IngestionService.
 */

#include "application/IngestionService.hpp"
#include <iostream>
#include "infrastructure/ToonCodec.hpp"

namespace casegraph::application {

using namespace casegraph::domain;

namespace {

constexpr size_t kOpenQuestionsInContext = 20;

void Accumulate(MergeReport& total, const MergeReport& batch) {
    total.newEntities += batch.newEntities;
    total.mergedEntities += batch.mergedEntities;
    total.newEvents += batch.newEvents;
    total.newQuestions += batch.newQuestions;
    total.answeredQuestions += batch.answeredQuestions;
    total.droppedQuestions += batch.droppedQuestions;
    total.degradedMatches += batch.degradedMatches;
    total.malformedCandidates += batch.malformedCandidates;
    total.decisions.insert(total.decisions.end(), batch.decisions.begin(), batch.decisions.end());
}

} // namespace

IngestionService::IngestionService(std::shared_ptr<DocumentSource> source,
                                   std::shared_ptr<ExtractionSupplier> supplier,
                                   ModeController& controller,
                                   size_t batchSize,
                                   size_t contextTopK)
    : m_source(std::move(source)),
      m_supplier(std::move(supplier)),
      m_controller(controller),
      m_batchSize(batchSize == 0 ? 1 : batchSize),
      m_contextTopK(contextTopK) {}

std::string IngestionService::extractionContext() const {
    const WorkspaceStore& store = m_controller.store();
    std::string context = store.ontologyContext(m_contextTopK);

    infrastructure::ToonTable open{"OpenQuestions", {}};
    for (const auto& q : store.unansweredQuestions()) {
        if (open.records.size() >= kOpenQuestionsInContext) break;
        open.records.push_back({{"id", q.id}, {"subject", q.subjectId}, {"text", q.text}});
    }
    context += "\n" + infrastructure::ToonCodec::EncodeTable(open);
    return context;
}

IngestionService::IngestionResult IngestionService::ingestNextBatch(std::function<void(std::string)> statusCallback,
                                                                    const std::atomic<bool>* cancelled) {
    IngestionResult result;
    if (!m_source || !m_supplier) {
        result.errors.push_back("ingestion needs a document source and an extraction supplier");
        return result;
    }

    const size_t total = m_source->totalDocuments();
    m_controller.setTotalDocuments(total);
    const IngestionCursor cursor = m_controller.cursor();
    if (cursor.lastCommittedIndex >= total) {
        result.exhausted = true;
        if (statusCallback) statusCallback("Nothing left to ingest for " + cursor.domain);
        return result;
    }

    const auto documents = m_source->fetch(cursor.lastCommittedIndex, m_batchSize);
    if (documents.empty()) {
        result.errors.push_back("document source returned nothing at index " +
                                std::to_string(cursor.lastCommittedIndex) + " of " + std::to_string(total));
        std::cerr << "[IngestionService] " << result.errors.back() << std::endl;
        return result;
    }
    const std::string context = extractionContext();

    ExtractionBatch batch;
    batch.firstDocumentIndex = cursor.lastCommittedIndex;
    batch.documentCount = documents.size();

    for (size_t i = 0; i < documents.size(); ++i) {
        if (cancelled && cancelled->load()) {
            result.errors.push_back("cancelled during extraction");
            return result;
        }
        const auto& doc = documents[i];
        const std::string chunkId = cursor.domain + ":" + std::to_string(doc.index);
        if (statusCallback) {
            statusCallback("Extracting " + doc.caseId + " (" + std::to_string(i + 1) + "/" +
                           std::to_string(documents.size()) + ")");
        }

        if (!doc.readable || doc.text.empty()) {
            ++result.extractionFailures;
            result.errors.push_back("document " + std::to_string(doc.index) + " has no readable text");
            continue;
        }

        auto extraction = m_supplier->extract(doc.text, chunkId, context);
        if (!extraction) {
            ++result.extractionFailures;
            result.errors.push_back("extraction failed for document " + std::to_string(doc.index) + " (" +
                                    doc.caseId + ")");
            continue;
        }
        extraction->caseId = doc.caseId;
        extraction->chunkId = chunkId;
        batch.chunks.push_back(std::move(*extraction));
    }

    if (statusCallback) statusCallback("Merging " + std::to_string(batch.chunks.size()) + " extraction(s)");
    BatchResult committed = m_controller.processBatch(batch, cancelled);

    result.batches = 1;
    result.committed = committed.committed;
    result.report = committed.report;
    result.documentsProcessed = committed.committed ? documents.size() : 0;
    result.errors.insert(result.errors.end(), committed.errors.begin(), committed.errors.end());
    result.warnings = committed.warnings;
    result.exhausted = m_controller.cursor().lastCommittedIndex >= total;

    if (!result.errors.empty()) {
        std::cerr << "[IngestionService] Batch at document " << batch.firstDocumentIndex << " finished with "
                  << result.errors.size() << " error(s)" << std::endl;
    }
    return result;
}

IngestionService::IngestionResult IngestionService::ingestPending(std::function<void(std::string)> statusCallback,
                                                                  size_t maxBatches,
                                                                  const std::atomic<bool>* cancelled) {
    IngestionResult total;
    total.committed = true;

    while (maxBatches == 0 || total.batches < maxBatches) {
        IngestionResult step = ingestNextBatch(statusCallback, cancelled);
        total.batches += step.batches;
        total.documentsProcessed += step.documentsProcessed;
        total.extractionFailures += step.extractionFailures;
        Accumulate(total.report, step.report);
        total.errors.insert(total.errors.end(), step.errors.begin(), step.errors.end());
        total.warnings.insert(total.warnings.end(), step.warnings.begin(), step.warnings.end());
        total.exhausted = step.exhausted;

        if (step.exhausted && step.batches == 0) break;
        if (!step.committed) {
            total.committed = false;
            break;
        }
        if (step.exhausted) break;
    }
    return total;
}

} // namespace casegraph::application
