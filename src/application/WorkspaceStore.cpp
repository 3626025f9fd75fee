/**
 * @file WorkspaceStore.cpp
 * @brief Implementation of WorkspaceStore.
 */

#include "application/WorkspaceStore.hpp"
#include <future>
#include <iostream>
#include <map>
#include <set>
#include "domain/Errors.hpp"
#include "infrastructure/ToonCodec.hpp"
#include "infrastructure/WorkspaceSnapshotCodec.hpp"

namespace casegraph::application {

using namespace casegraph::domain;

WorkspaceStore::WorkspaceStore(Workspace workspace, EntityResolver resolver, size_t resolveWorkers)
    : m_domain(workspace.domain()),
      m_resolver(std::move(resolver)),
      m_pool(std::make_unique<ResolveWorkerPool>(resolveWorkers)),
      m_workspace(std::move(workspace)) {}

MergeReport WorkspaceStore::appendBatch(const ExtractionBatch& batch, const std::atomic<bool>* cancelled) {
    std::unique_lock<std::mutex> writer(m_batchMutex, std::try_to_lock);
    if (!writer.owns_lock()) {
        throw ConcurrentBatchError(m_domain);
    }

    auto resolved = resolvePhase(batch, cancelled);

    // The committed state is only replaced once the working copy is complete.
    Workspace next = m_workspace;
    MergeReport report;
    try {
        report = applyPhase(batch, resolved, next);
    } catch (const std::exception& e) {
        std::cerr << "[WorkspaceStore] Batch at document " << batch.firstDocumentIndex
                  << " rolled back: " << e.what() << std::endl;
        throw;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_stateMutex);
        m_workspace = std::move(next);
    }

    std::cout << "[WorkspaceStore] " << m_domain << " v" << m_workspace.version() << ": "
              << report.newEntities << " new, " << report.mergedEntities << " merged, "
              << report.newEvents << " events, " << report.newQuestions << " questions";
    if (report.degradedMatches) std::cout << ", " << report.degradedMatches << " degraded";
    if (report.malformedCandidates) std::cout << ", " << report.malformedCandidates << " malformed";
    std::cout << std::endl;
    return report;
}

std::vector<WorkspaceStore::ResolvedChunk> WorkspaceStore::resolvePhase(const ExtractionBatch& batch,
                                                                        const std::atomic<bool>* cancelled) const {
    auto isCancelled = [cancelled] { return cancelled && cancelled->load(); };

    std::vector<ResolvedChunk> resolved(batch.chunks.size());
    for (size_t c = 0; c < batch.chunks.size(); ++c) {
        const auto& chunk = batch.chunks[c];
        std::set<std::string> localIds;
        for (const auto& candidate : chunk.entities) {
            ResolvedCandidate rc;
            rc.source = &candidate;
            // A repeated local id within a chunk is ambiguous; only the first one counts.
            if (localIds.insert(candidate.localId).second) {
                rc.entity = EntityResolver::Materialize(candidate, chunk.caseId);
            }
            resolved[c].push_back(std::move(rc));
        }
    }

    struct Pending {
        ResolvedCandidate* target;
        std::future<Resolution> future;
    };
    std::vector<Pending> pending;
    bool aborted = false;
    for (auto& chunk : resolved) {
        for (auto& rc : chunk) {
            if (!rc.entity) continue;
            if (isCancelled()) {
                aborted = true;
                break;
            }
            const Entity* candidate = &*rc.entity;
            pending.push_back({&rc, m_pool->submit([this, candidate] {
                return m_resolver.resolve(*candidate, m_workspace);
            })});
        }
        if (aborted) break;
    }

    // Every task borrows from this frame, so all of them finish before anything propagates.
    for (auto& p : pending) p.future.wait();
    if (aborted || isCancelled()) {
        std::cout << "[WorkspaceStore] Batch at document " << batch.firstDocumentIndex
                  << " cancelled during resolve; workspace untouched" << std::endl;
        throw BatchAborted("batch cancelled during resolve phase");
    }
    for (auto& p : pending) p.target->resolution = p.future.get();
    return resolved;
}

MergeReport WorkspaceStore::applyPhase(const ExtractionBatch& batch, std::vector<ResolvedChunk>& resolved,
                                       Workspace& next) const {
    const StateTiePolicy policy = m_resolver.settings().tiePolicy;
    MergeReport report;
    std::vector<OntologyTerm> terms;

    for (size_t c = 0; c < batch.chunks.size(); ++c) {
        const auto& chunk = batch.chunks[c];
        std::map<std::string, std::string> localToFinal;
        std::set<std::string> droppedLocals;
        report.malformedCandidates += chunk.malformedItems;

        for (auto& rc : resolved[c]) {
            MergeDecision decision;
            decision.chunkIndex = c;
            decision.localId = rc.source->localId;

            if (!rc.entity) {
                decision.kind = MergeDecision::Kind::Dropped;
                ++report.malformedCandidates;
                if (!localToFinal.count(rc.source->localId)) droppedLocals.insert(rc.source->localId);
                std::cerr << "[WorkspaceStore] Dropped malformed candidate '" << rc.source->localId << "' in "
                          << chunk.chunkId << std::endl;
                report.decisions.push_back(decision);
                continue;
            }

            Entity& incoming = *rc.entity;
            const Resolution& resolution = rc.resolution;
            decision.score = resolution.score;
            decision.exactMatch = resolution.exactMatch;
            decision.degraded = resolution.degraded;
            if (resolution.degraded) ++report.degradedMatches;

            std::string targetId;
            if (resolution.kind == MergeDecision::Kind::MergeInto) {
                targetId = resolution.targetId;
            } else {
                // An earlier chunk of this batch may have created the actor or added the alias.
                if (auto hit = EntityResolver::ExactAliasMatch(incoming, next.entitiesOfType(incoming.type))) {
                    targetId = *hit;
                    decision.exactMatch = true;
                    decision.score = 1.0;
                }
            }

            if (!targetId.empty()) {
                Entity* target = next.mutableEntity(targetId);
                if (!target) {
                    throw ReferenceIntegrityViolation(chunk.chunkId + "/" + rc.source->localId, targetId);
                }
                target->absorb(incoming, policy);
                decision.kind = MergeDecision::Kind::MergeInto;
                ++report.mergedEntities;
            } else {
                incoming.id = next.allocateEntityId();
                targetId = incoming.id;
                next.insertEntity(incoming);
                decision.kind = MergeDecision::Kind::CreateNew;
                ++report.newEntities;
            }
            decision.entityId = targetId;
            localToFinal[rc.source->localId] = targetId;
            droppedLocals.erase(rc.source->localId);

            terms.push_back({TermKind::EntityType, EntityTypeToString(incoming.type)});
            for (const auto& role : incoming.roles) terms.push_back({TermKind::Role, role});
            for (const auto& [key, state] : incoming.states) terms.push_back({TermKind::StateKey, key});
            report.decisions.push_back(decision);
        }

        // nullopt: the reference pointed at a dropped candidate.
        auto resolveRef = [&](const std::string& ref, const std::string& owner) -> std::optional<std::string> {
            auto local = localToFinal.find(ref);
            if (local != localToFinal.end()) return local->second;
            if (droppedLocals.count(ref)) return std::nullopt;
            if (next.hasEntity(ref)) return ref;
            throw ReferenceIntegrityViolation(owner, ref);
        };

        for (size_t i = 0; i < chunk.events.size(); ++i) {
            const auto& ce = chunk.events[i];
            const std::string owner = chunk.chunkId + "/event#" + std::to_string(i);
            if (ce.verb.empty() || ce.agentRef.empty()) {
                ++report.malformedCandidates;
                std::cerr << "[WorkspaceStore] Dropped malformed event " << owner << std::endl;
                continue;
            }

            Event event;
            event.verb = ce.verb;
            event.implicit = ce.implicit;
            event.caseId = chunk.caseId;
            bool cascaded = false;
            auto take = [&](const std::string& ref) -> std::string {
                auto id = resolveRef(ref, owner);
                if (!id) cascaded = true;
                return id.value_or("");
            };
            event.agentId = take(ce.agentRef);
            for (const auto& p : ce.patientRefs) event.patientIds.push_back(take(p));
            if (ce.temporalRef) event.temporalId = take(*ce.temporalRef);
            if (ce.spatialRef) event.spatialId = take(*ce.spatialRef);

            if (cascaded) {
                ++report.malformedCandidates;
                std::cerr << "[WorkspaceStore] Dropped event " << owner << " referencing a dropped candidate"
                          << std::endl;
                continue;
            }
            if (next.appendEvent(event)) {
                ++report.newEvents;
                terms.push_back({TermKind::Verb, ce.verb});
            }
        }

        for (size_t i = 0; i < chunk.questions.size(); ++i) {
            const auto& cq = chunk.questions[i];
            const std::string owner = chunk.chunkId + "/question#" + std::to_string(i);
            if (NormalizeAlias(cq.text).empty()) {
                ++report.malformedCandidates;
                continue;
            }
            Question question;
            question.text = cq.text;
            question.sourceCaseId = chunk.caseId;
            if (cq.subjectRef) {
                auto subject = resolveRef(*cq.subjectRef, owner);
                if (!subject) {
                    ++report.malformedCandidates;
                    std::cerr << "[WorkspaceStore] Dropped question " << owner
                              << " about a dropped candidate" << std::endl;
                    continue;
                }
                question.subjectId = *subject;
            }
            if (next.appendQuestion(question)) ++report.newQuestions;
        }

        for (const auto& answer : chunk.answers) {
            const Question* existing = next.findQuestion(answer.questionId);
            if (NormalizeAlias(answer.answerText).empty() || !existing) {
                ++report.malformedCandidates;
                std::cerr << "[WorkspaceStore] Ignored answer for '" << answer.questionId << "' in "
                          << chunk.chunkId << std::endl;
                continue;
            }
            if (next.answerQuestion(answer.questionId, answer.answerText, chunk.caseId)) {
                ++report.answeredQuestions;
            }
        }

        for (const auto& questionId : chunk.droppedQuestionIds) {
            if (next.dropQuestion(questionId)) ++report.droppedQuestions;
        }
    }

    for (const auto& event : next.events()) {
        for (const auto& ref : event.references()) {
            if (!next.hasEntity(ref)) throw ReferenceIntegrityViolation(event.id, ref);
        }
    }
    for (const auto& question : next.questions()) {
        if (question.subjectId && !next.hasEntity(*question.subjectId)) {
            throw ReferenceIntegrityViolation(question.id, *question.subjectId);
        }
    }

    next.ontology().update(terms);
    next.addDocuments(batch.documentCount);
    next.bumpVersion();
    return report;
}

std::string WorkspaceStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    return infrastructure::WorkspaceSnapshotCodec::Encode(m_workspace);
}

void WorkspaceStore::restore(const std::string& bytes) {
    Workspace loaded = infrastructure::WorkspaceSnapshotCodec::Decode(bytes);
    if (loaded.domain() != m_domain) {
        throw SnapshotFormatError("snapshot belongs to domain '" + loaded.domain() + "', expected '" +
                                  m_domain + "'");
    }
    replaceWorkspace(std::move(loaded));
}

Workspace WorkspaceStore::workspace() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    return m_workspace;
}

void WorkspaceStore::replaceWorkspace(Workspace workspace) {
    std::unique_lock<std::mutex> writer(m_batchMutex, std::try_to_lock);
    if (!writer.owns_lock()) {
        throw ConcurrentBatchError(m_domain);
    }
    std::unique_lock<std::shared_mutex> lock(m_stateMutex);
    m_workspace = std::move(workspace);
}

std::optional<EntityView> WorkspaceStore::queryByEntity(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    const Entity* entity = m_workspace.findEntity(id);
    if (!entity) return std::nullopt;

    EntityView view;
    view.entity = *entity;
    for (const Event* event : m_workspace.eventsReferencing(id)) view.events.push_back(*event);
    for (const auto& q : m_workspace.questions()) {
        if (q.subjectId == id) view.questions.push_back(q);
    }
    return view;
}

CaseView WorkspaceStore::queryByCase(const std::string& caseId) const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    CaseView view;
    view.caseId = caseId;
    for (const Entity* e : m_workspace.entitiesInCase(caseId)) view.entities.push_back(*e);
    for (const Event* e : m_workspace.eventsInCase(caseId)) view.events.push_back(*e);
    for (const auto& q : m_workspace.questions()) {
        if (q.sourceCaseId == caseId || q.answeredInCaseId == caseId) view.questions.push_back(q);
    }
    return view;
}

std::vector<Question> WorkspaceStore::unansweredQuestions() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    std::vector<Question> out;
    for (const Question* q : m_workspace.unansweredQuestions()) out.push_back(*q);
    return out;
}

std::vector<Entity> WorkspaceStore::queryByRole(const std::string& role) const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    std::vector<Entity> out;
    for (const Entity* e : m_workspace.entitiesWithRole(role)) out.push_back(*e);
    return out;
}

std::vector<Entity> WorkspaceStore::queryByState(const std::string& key, const std::optional<std::string>& value) const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    std::vector<Entity> out;
    for (const Entity* e : m_workspace.entitiesWithState(key, value)) out.push_back(*e);
    return out;
}

std::vector<Event> WorkspaceStore::timeline() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    std::vector<Event> out;
    for (const Event* e : m_workspace.timeline()) out.push_back(*e);
    return out;
}

WorkspaceStatistics WorkspaceStore::statistics() const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    return m_workspace.statistics();
}

std::vector<TermCount> WorkspaceStore::ontologySummary(size_t topK) const {
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);
    return m_workspace.ontology().summary(topK);
}

std::string WorkspaceStore::ontologyContext(size_t topK) const {
    using infrastructure::ToonTable;
    std::shared_lock<std::shared_mutex> lock(m_stateMutex);

    auto table = [&](const std::string& name, TermKind kind) {
        ToonTable t{name, {}};
        for (const auto& entry : m_workspace.ontology().summary(kind, topK)) {
            t.records.push_back({{"term", entry.term}, {"count", std::to_string(entry.count)}});
        }
        return t;
    };
    return infrastructure::ToonCodec::Encode(
        {table("Roles", TermKind::Role), table("Verbs", TermKind::Verb), table("StateKeys", TermKind::StateKey)},
        "ontology context for " + m_domain);
}

} // namespace casegraph::application
