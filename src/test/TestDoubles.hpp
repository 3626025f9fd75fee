// Shared mocks and builders for the casegraph tests.
#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "domain/Candidate.hpp"
#include "domain/ExtractionSupplier.hpp"
#include "domain/SimilarityOracle.hpp"
#include "domain/SourceDocument.hpp"
#include "domain/WorkspacePersister.hpp"

namespace casegraph::test {

// Scores by (candidate name, existing name); unknown pairs get the default score.
class ScriptedOracle : public domain::SimilarityOracle {
public:
    explicit ScriptedOracle(double defaultScore = 0.0) : m_default(defaultScore) {}

    void set(const std::string& candidateName, const std::string& existingName, double score) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scores[{candidateName, existingName}] = score;
    }

    std::optional<double> score(const domain::Entity& candidate, const domain::Entity& existing) override {
        ++calls;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (unavailable) return std::nullopt;
        if (throws) throw std::runtime_error("oracle backend down");
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_scores.find({candidate.name, existing.name});
        return it == m_scores.end() ? m_default : it->second;
    }

    std::atomic<int> calls{0};
    std::atomic<bool> unavailable{false};
    std::atomic<bool> throws{false};
    std::chrono::milliseconds delay{0};

private:
    double m_default;
    std::map<std::pair<std::string, std::string>, double> m_scores;
    std::mutex m_mutex;
};

// Durable in-memory persister with switchable failures.
class MemoryPersister : public domain::WorkspacePersister {
public:
    bool persistSnapshot(const std::string& domain, const std::string& bytes) override {
        ++snapshotWrites;
        if (failSnapshot) return false;
        snapshots[domain] = bytes;
        return true;
    }

    bool persistCursor(const domain::IngestionCursor& cursor) override {
        ++cursorWrites;
        if (failCursor) return false;
        cursors[cursor.domain] = cursor;
        return true;
    }

    bool isDurable() const override { return true; }

    bool failSnapshot = false;
    bool failCursor = false;
    int snapshotWrites = 0;
    int cursorWrites = 0;
    std::map<std::string, std::string> snapshots;
    std::map<std::string, domain::IngestionCursor> cursors;
};

// Returns a prepared extraction per document text; unknown texts fail.
class ScriptedSupplier : public domain::ExtractionSupplier {
public:
    void set(const std::string& text, domain::ChunkExtraction extraction) { m_replies[text] = std::move(extraction); }

    std::optional<domain::ChunkExtraction> extract(const std::string& documentText,
                                                   const std::string&,
                                                   const std::optional<std::string>& ontologyContext) override {
        ++calls;
        if (ontologyContext) lastContext = *ontologyContext;
        auto it = m_replies.find(documentText);
        if (it == m_replies.end()) return std::nullopt;
        return it->second;
    }

    int calls = 0;
    std::string lastContext;

private:
    std::map<std::string, domain::ChunkExtraction> m_replies;
};

class VectorDocumentSource : public domain::DocumentSource {
public:
    void add(const std::string& caseId, const std::string& text) {
        domain::SourceDocument doc;
        doc.index = docs.size();
        doc.caseId = caseId;
        doc.text = text;
        docs.push_back(doc);
    }

    size_t totalDocuments() const override { return docs.size(); }

    std::vector<domain::SourceDocument> fetch(size_t first, size_t count) const override {
        std::vector<domain::SourceDocument> out;
        for (size_t i = first; i < docs.size() && i < first + count; ++i) out.push_back(docs[i]);
        return out;
    }

    std::vector<domain::SourceDocument> docs;
};

inline domain::CandidateEntity Person(const std::string& localId, const std::string& name,
                                      std::vector<std::string> roles = {},
                                      std::vector<std::string> aliases = {}) {
    domain::CandidateEntity c;
    c.localId = localId;
    c.type = "person";
    c.name = name;
    c.roles = std::move(roles);
    c.aliases = std::move(aliases);
    return c;
}

inline domain::CandidateEntity Typed(const std::string& localId, const std::string& type, const std::string& name) {
    domain::CandidateEntity c;
    c.localId = localId;
    c.type = type;
    c.name = name;
    return c;
}

inline domain::ChunkExtraction Chunk(const std::string& caseId, std::vector<domain::CandidateEntity> entities) {
    domain::ChunkExtraction chunk;
    chunk.caseId = caseId;
    chunk.chunkId = caseId + "#0";
    chunk.entities = std::move(entities);
    return chunk;
}

inline domain::ExtractionBatch Batch(std::vector<domain::ChunkExtraction> chunks, size_t first = 0) {
    domain::ExtractionBatch batch;
    batch.firstDocumentIndex = first;
    batch.documentCount = chunks.size();
    batch.chunks = std::move(chunks);
    return batch;
}

} // namespace casegraph::test
