/**
 * @file Workspace.cpp
 * @brief Implementation of Workspace queries and mutation primitives.
 */

#include "domain/Workspace.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace casegraph::domain {

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void SortById(std::vector<const Entity*>& entities) {
    std::sort(entities.begin(), entities.end(), [](const Entity* a, const Entity* b) {
        return CompareEntityIds(a->id, b->id) < 0;
    });
}

} // namespace

Workspace::Workspace(std::string domain) : m_domain(std::move(domain)), m_ontology(m_domain) {}

const Entity* Workspace::findEntity(const std::string& id) const {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

Entity* Workspace::mutableEntity(const std::string& id) {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

std::vector<const Entity*> Workspace::entitiesOfType(EntityType type) const {
    std::vector<const Entity*> out;
    for (const auto& [id, entity] : m_entities) {
        if (entity.type == type) out.push_back(&entity);
    }
    SortById(out);
    return out;
}

std::vector<const Entity*> Workspace::entitiesInCase(const std::string& caseId) const {
    std::vector<const Entity*> out;
    for (const auto& [id, entity] : m_entities) {
        if (entity.involvedCases.count(caseId)) out.push_back(&entity);
    }
    SortById(out);
    return out;
}

std::vector<const Event*> Workspace::eventsInCase(const std::string& caseId) const {
    std::vector<const Event*> out;
    for (const auto& event : m_events) {
        if (event.caseId == caseId) out.push_back(&event);
    }
    return out;
}

std::vector<const Event*> Workspace::eventsReferencing(const std::string& entityId) const {
    std::vector<const Event*> out;
    for (const auto& event : m_events) {
        auto refs = event.references();
        if (std::find(refs.begin(), refs.end(), entityId) != refs.end()) out.push_back(&event);
    }
    return out;
}

std::vector<const Question*> Workspace::unansweredQuestions() const {
    std::vector<const Question*> out;
    for (const auto& q : m_questions) {
        if (!q.answered) out.push_back(&q);
    }
    return out;
}

const Question* Workspace::findQuestion(const std::string& id) const {
    auto it = std::find_if(m_questions.begin(), m_questions.end(), [&id](const Question& q) { return q.id == id; });
    return it == m_questions.end() ? nullptr : &*it;
}

std::vector<const Entity*> Workspace::entitiesWithRole(const std::string& role) const {
    const std::string needle = Lower(role);
    std::vector<const Entity*> out;
    for (const auto& [id, entity] : m_entities) {
        bool match = std::any_of(entity.roles.begin(), entity.roles.end(), [&needle](const std::string& r) {
            return Lower(r).find(needle) != std::string::npos;
        });
        if (match) out.push_back(&entity);
    }
    SortById(out);
    return out;
}

std::vector<const Entity*> Workspace::entitiesWithState(const std::string& key,
                                                        const std::optional<std::string>& value) const {
    const std::string wantedKey = Lower(key);
    std::vector<const Entity*> out;
    for (const auto& [id, entity] : m_entities) {
        for (const auto& [stateKey, state] : entity.states) {
            if (Lower(stateKey) != wantedKey) continue;
            if (value && Lower(state.value) != Lower(*value)) continue;
            out.push_back(&entity);
            break;
        }
    }
    SortById(out);
    return out;
}

std::vector<const Event*> Workspace::timeline() const {
    struct Dated {
        const Event* event;
        FuzzyDate date;
    };
    std::vector<Dated> dated;
    for (const auto& event : m_events) {
        if (!event.temporalId) continue;
        const Entity* marker = findEntity(*event.temporalId);
        if (!marker) continue;
        dated.push_back({&event, FuzzyDate::FromText(marker->name)});
    }

    // Parsed dates first in chronological order, raw-only dates after them.
    std::stable_sort(dated.begin(), dated.end(), [](const Dated& a, const Dated& b) {
        if (a.date.hasParsed() != b.date.hasParsed()) return a.date.hasParsed();
        if (a.date.hasParsed() && *a.date.parsedDay != *b.date.parsedDay) return *a.date.parsedDay < *b.date.parsedDay;
        if (a.date.rawText != b.date.rawText) return a.date.rawText < b.date.rawText;
        return CompareEntityIds(a.event->id, b.event->id) < 0;
    });

    std::vector<const Event*> out;
    out.reserve(dated.size());
    for (const auto& d : dated) out.push_back(d.event);
    return out;
}

WorkspaceStatistics Workspace::statistics() const {
    WorkspaceStatistics stats;
    stats.entities = m_entities.size();
    for (const auto& [id, entity] : m_entities) {
        ++stats.entitiesByType[EntityTypeToString(entity.type)];
    }
    stats.events = m_events.size();
    stats.questions = m_questions.size();
    for (const auto& q : m_questions) {
        if (q.answered) ++stats.answeredQuestions;
        else ++stats.unansweredQuestions;
    }
    stats.ontologyTerms = m_ontology.size();
    stats.version = m_version;
    stats.documentCount = m_documentCount;
    return stats;
}

std::string Workspace::allocateEntityId() {
    return "E" + std::to_string(m_nextEntity++);
}

std::string Workspace::allocateEventId() {
    return "V" + std::to_string(m_nextEvent++);
}

std::string Workspace::allocateQuestionId() {
    return "Q" + std::to_string(m_nextQuestion++);
}

Entity& Workspace::insertEntity(Entity entity) {
    if (entity.id.empty()) {
        throw std::logic_error("entity inserted without an id");
    }
    auto [it, inserted] = m_entities.emplace(entity.id, std::move(entity));
    if (!inserted) {
        throw std::logic_error("entity id '" + it->first + "' is already taken");
    }
    return it->second;
}

bool Workspace::appendEvent(Event event) {
    bool duplicate = std::any_of(m_events.begin(), m_events.end(),
                                 [&event](const Event& e) { return e.sameFact(event); });
    if (duplicate) return false;
    if (event.id.empty()) event.id = allocateEventId();
    m_verbVocabulary.observe(event.verb);
    m_events.push_back(std::move(event));
    return true;
}

bool Workspace::appendQuestion(Question question) {
    const std::string key = NormalizeAlias(question.text);
    if (key.empty()) return false;
    bool duplicate = std::any_of(m_questions.begin(), m_questions.end(), [&](const Question& q) {
        return q.subjectId == question.subjectId && NormalizeAlias(q.text) == key;
    });
    if (duplicate) return false;
    if (question.id.empty()) question.id = allocateQuestionId();
    m_questions.push_back(std::move(question));
    return true;
}

bool Workspace::answerQuestion(const std::string& id, const std::string& answer, const std::string& caseId) {
    if (NormalizeAlias(answer).empty()) return false;
    auto it = std::find_if(m_questions.begin(), m_questions.end(), [&id](const Question& q) { return q.id == id; });
    if (it == m_questions.end() || it->answered) return false;
    it->answered = true;
    it->answer = answer;
    it->answeredInCaseId = caseId;
    return true;
}

bool Workspace::dropQuestion(const std::string& id) {
    auto it = std::find_if(m_questions.begin(), m_questions.end(),
                           [&id](const Question& q) { return q.id == id && !q.answered; });
    if (it == m_questions.end()) return false;
    m_questions.erase(it);
    return true;
}

Workspace::Counters Workspace::counters() const {
    return Counters{m_version, m_documentCount, m_nextEntity, m_nextEvent, m_nextQuestion};
}

void Workspace::restoreCounters(const Counters& counters) {
    m_version = counters.version;
    m_documentCount = counters.documentCount;
    m_nextEntity = counters.nextEntity;
    m_nextEvent = counters.nextEvent;
    m_nextQuestion = counters.nextQuestion;
}

bool Workspace::operator==(const Workspace& o) const {
    return m_domain == o.m_domain && m_version == o.m_version && m_documentCount == o.m_documentCount &&
           m_nextEntity == o.m_nextEntity && m_nextEvent == o.m_nextEvent && m_nextQuestion == o.m_nextQuestion &&
           m_entities == o.m_entities && m_events == o.m_events && m_questions == o.m_questions &&
           m_ontology == o.m_ontology && m_verbVocabulary == o.m_verbVocabulary;
}

} // namespace casegraph::domain
