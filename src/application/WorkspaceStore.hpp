/**
 * @file WorkspaceStore.hpp
 * @brief Global Workspace store: two-phase batch append, snapshots and read queries.
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "application/ResolveWorkerPool.hpp"
#include "domain/Candidate.hpp"
#include "domain/EntityResolver.hpp"
#include "domain/MergeReport.hpp"
#include "domain/Workspace.hpp"

namespace casegraph::application {

/**
 * @struct EntityView
 * @brief An entity with the events and questions that point at it.
 */
struct EntityView {
    domain::Entity entity;
    std::vector<domain::Event> events;
    std::vector<domain::Question> questions;
};

/**
 * @struct CaseView
 * @brief Everything a case contributed, for cross-case connectivity.
 */
struct CaseView {
    std::string caseId;
    std::vector<domain::Entity> entities;
    std::vector<domain::Event> events;
    std::vector<domain::Question> questions;   ///< Raised or answered in the case.
};

/**
 * @class WorkspaceStore
 * @brief Owns one domain's Workspace. appendBatch is the only mutating entry point.
 *
 * A batch is resolved in parallel against the committed state, then applied serially to a
 * working copy that replaces the committed state only when the whole batch succeeded.
 * Between two appendBatch calls readers always see a fully committed workspace.
 */
class WorkspaceStore {
public:
    WorkspaceStore(domain::Workspace workspace, domain::EntityResolver resolver, size_t resolveWorkers = 4);

    const std::string& domain() const { return m_domain; }

    /**
     * @brief Resolves and applies a batch all-or-nothing.
     * @param cancelled Checked during the resolve phase; once set the batch is abandoned untouched.
     * @throws domain::ConcurrentBatchError if another batch is in flight.
     * @throws domain::BatchAborted if cancelled before apply.
     * @throws domain::ReferenceIntegrityViolation (after rolling back) on a dangling reference.
     */
    domain::MergeReport appendBatch(const domain::ExtractionBatch& batch,
                                    const std::atomic<bool>* cancelled = nullptr);

    /** @brief TOON snapshot of the committed state. */
    std::string snapshot() const;

    /**
     * @brief Replaces the committed state with a decoded snapshot. No partial load on failure.
     * @throws domain::SnapshotSchemaMismatch, domain::SnapshotFormatError
     */
    void restore(const std::string& bytes);

    /** @brief Deep copy of the committed state. */
    domain::Workspace workspace() const;

    /**
     * @brief Puts back a previously taken copy (rollback after a failed durable write).
     * @throws domain::ConcurrentBatchError if a batch is in flight.
     */
    void replaceWorkspace(domain::Workspace workspace);

    // --- Queries over the committed state ---

    std::optional<EntityView> queryByEntity(const std::string& id) const;
    CaseView queryByCase(const std::string& caseId) const;
    std::vector<domain::Question> unansweredQuestions() const;
    std::vector<domain::Entity> queryByRole(const std::string& role) const;
    std::vector<domain::Entity> queryByState(const std::string& key,
                                             const std::optional<std::string>& value = std::nullopt) const;
    std::vector<domain::Event> timeline() const;
    domain::WorkspaceStatistics statistics() const;
    std::vector<domain::TermCount> ontologySummary(size_t topK) const;

    /** @brief Top terms per kind as TOON tables (Roles, Verbs, StateKeys), fed to the next extraction. */
    std::string ontologyContext(size_t topK) const;

private:
    struct ResolvedCandidate {
        const domain::CandidateEntity* source = nullptr;
        std::optional<domain::Entity> entity;   ///< nullopt when the candidate is malformed.
        domain::Resolution resolution;
    };
    using ResolvedChunk = std::vector<ResolvedCandidate>;

    std::vector<ResolvedChunk> resolvePhase(const domain::ExtractionBatch& batch,
                                            const std::atomic<bool>* cancelled) const;
    domain::MergeReport applyPhase(const domain::ExtractionBatch& batch, std::vector<ResolvedChunk>& resolved,
                                   domain::Workspace& next) const;

    std::string m_domain;
    domain::EntityResolver m_resolver;
    std::unique_ptr<ResolveWorkerPool> m_pool;

    domain::Workspace m_workspace;
    mutable std::shared_mutex m_stateMutex;   ///< Readers vs. the commit swap.
    std::mutex m_batchMutex;                  ///< Single writer.
};

} // namespace casegraph::application
