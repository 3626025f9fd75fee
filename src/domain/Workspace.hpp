/**
 * @file Workspace.hpp
 * @brief Per-domain graph of entities, events, questions and ontology counts.
 */

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/Entity.hpp"
#include "domain/Event.hpp"
#include "domain/OntologyAggregator.hpp"
#include "domain/Question.hpp"

namespace casegraph::domain {

/**
 * @struct WorkspaceStatistics
 */
struct WorkspaceStatistics {
    size_t entities = 0;
    std::map<std::string, size_t> entitiesByType;
    size_t events = 0;
    size_t questions = 0;
    size_t unansweredQuestions = 0;
    size_t answeredQuestions = 0;
    size_t ontologyTerms = 0;
    uint64_t version = 0;
    uint64_t documentCount = 0;
};

/**
 * @class Workspace
 * @brief Value type holding the full committed state of one domain.
 *
 * Copying a Workspace is a deep copy; the store keeps one as the pre-batch image
 * for rollback and calibration runs work on their own copy.
 */
class Workspace {
public:
    explicit Workspace(std::string domain = "");

    const std::string& domain() const { return m_domain; }
    uint64_t version() const { return m_version; }
    uint64_t documentCount() const { return m_documentCount; }

    const std::map<std::string, Entity>& entities() const { return m_entities; }
    const std::vector<Event>& events() const { return m_events; }
    const std::vector<Question>& questions() const { return m_questions; }
    const OntologyAggregator& ontology() const { return m_ontology; }
    OntologyAggregator& ontology() { return m_ontology; }
    const OpenVocabulary& verbVocabulary() const { return m_verbVocabulary; }
    OpenVocabulary& verbVocabulary() { return m_verbVocabulary; }

    // --- Queries ---

    const Entity* findEntity(const std::string& id) const;
    bool hasEntity(const std::string& id) const { return m_entities.count(id) > 0; }

    /** @brief Entities of @p type ordered by numeric id. */
    std::vector<const Entity*> entitiesOfType(EntityType type) const;

    /** @brief Entities whose involved-case set contains @p caseId. */
    std::vector<const Entity*> entitiesInCase(const std::string& caseId) const;

    /** @brief Events whose provenance is @p caseId. */
    std::vector<const Event*> eventsInCase(const std::string& caseId) const;

    /** @brief Events referencing @p entityId in any slot. */
    std::vector<const Event*> eventsReferencing(const std::string& entityId) const;

    std::vector<const Question*> unansweredQuestions() const;
    const Question* findQuestion(const std::string& id) const;

    /** @brief Entities having a role containing @p role (case-insensitive). */
    std::vector<const Entity*> entitiesWithRole(const std::string& role) const;

    /** @brief Entities having state @p key (and @p value when given), case-insensitive. */
    std::vector<const Entity*> entitiesWithState(const std::string& key,
                                                 const std::optional<std::string>& value = std::nullopt) const;

    /** @brief Events with a temporal reference, by parsed date, then raw text, then id. */
    std::vector<const Event*> timeline() const;

    WorkspaceStatistics statistics() const;

    // --- Mutation primitives (used by the store's apply phase only) ---

    /** @brief Allocates the next entity id. Ids are never reused. */
    std::string allocateEntityId();
    std::string allocateEventId();
    std::string allocateQuestionId();

    Entity& insertEntity(Entity entity);
    Entity* mutableEntity(const std::string& id);

    /** @brief Appends unless an event with the same fact exists. @return True if appended. */
    bool appendEvent(Event event);

    /** @brief Appends unless a question with the same subject and text exists. @return True if appended. */
    bool appendQuestion(Question question);

    /** @brief Marks an unanswered question answered. Empty answers are refused. */
    bool answerQuestion(const std::string& id, const std::string& answer, const std::string& caseId);

    /** @brief Removes an unanswered question. @return True if removed. */
    bool dropQuestion(const std::string& id);

    void bumpVersion() { ++m_version; }
    void addDocuments(uint64_t n) { m_documentCount += n; }

    // --- Snapshot restore ---

    struct Counters {
        uint64_t version = 0;
        uint64_t documentCount = 0;
        uint64_t nextEntity = 1;
        uint64_t nextEvent = 1;
        uint64_t nextQuestion = 1;
    };
    Counters counters() const;
    void restoreCounters(const Counters& counters);

    bool operator==(const Workspace& o) const;
    bool operator!=(const Workspace& o) const { return !(*this == o); }

private:
    std::string m_domain;
    uint64_t m_version = 0;
    uint64_t m_documentCount = 0;
    uint64_t m_nextEntity = 1;
    uint64_t m_nextEvent = 1;
    uint64_t m_nextQuestion = 1;

    std::map<std::string, Entity> m_entities;
    std::vector<Event> m_events;
    std::vector<Question> m_questions;
    OntologyAggregator m_ontology;
    OpenVocabulary m_verbVocabulary;
};

} // namespace casegraph::domain
