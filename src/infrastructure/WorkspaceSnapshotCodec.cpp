#include "infrastructure/WorkspaceSnapshotCodec.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include "domain/Errors.hpp"

namespace casegraph::infrastructure {

using namespace casegraph::domain;

namespace {

std::string FormatDouble(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return buf;
}

ToonValue OptionalText(const std::optional<std::string>& value) {
    return value ? ToonValue(*value) : std::nullopt;
}

const ToonTable& RequireTable(const std::map<std::string, const ToonTable*>& byName, const std::string& name) {
    auto it = byName.find(name);
    if (it == byName.end()) {
        throw SnapshotFormatError("missing table " + name);
    }
    return *it->second;
}

std::optional<std::string> OptionalField(const ToonRecord& record, const std::string& table, const std::string& field) {
    const ToonValue* value = ToonCodec::Find(record, field);
    if (!value) {
        throw SnapshotFormatError(table + " record lacks field '" + field + "'");
    }
    return *value;
}

std::string RequireField(const ToonRecord& record, const std::string& table, const std::string& field) {
    auto value = OptionalField(record, table, field);
    if (!value) {
        throw SnapshotFormatError(table + "." + field + " must not be null");
    }
    return *value;
}

uint64_t RequireUnsigned(const ToonRecord& record, const std::string& table, const std::string& field) {
    const std::string text = RequireField(record, table, field);
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw SnapshotFormatError(table + "." + field + " is not a number: '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        throw SnapshotFormatError(table + "." + field + " is out of range: '" + text + "'");
    }
}

bool RequireBool(const ToonRecord& record, const std::string& table, const std::string& field) {
    const std::string text = RequireField(record, table, field);
    if (text == "true") return true;
    if (text == "false") return false;
    throw SnapshotFormatError(table + "." + field + " is not a boolean: '" + text + "'");
}

Entity& OwnerOf(Workspace& workspace, const ToonRecord& record, const std::string& table) {
    const std::string id = RequireField(record, table, "entity");
    Entity* entity = workspace.mutableEntity(id);
    if (!entity) {
        throw SnapshotFormatError(table + " row refers to unknown entity '" + id + "'");
    }
    return *entity;
}

} // namespace

std::vector<ToonTable> WorkspaceSnapshotCodec::ToTables(const Workspace& workspace) {
    const auto counters = workspace.counters();

    ToonTable meta{"Meta", {}};
    meta.records.push_back({
        {"schema", std::string(kSchemaTag)},
        {"domain", workspace.domain()},
        {"version", std::to_string(counters.version)},
        {"document_count", std::to_string(counters.documentCount)},
        {"next_entity", std::to_string(counters.nextEntity)},
        {"next_event", std::to_string(counters.nextEvent)},
        {"next_question", std::to_string(counters.nextQuestion)},
    });

    std::vector<const Entity*> ordered;
    for (const auto& [id, entity] : workspace.entities()) ordered.push_back(&entity);
    std::sort(ordered.begin(), ordered.end(),
              [](const Entity* a, const Entity* b) { return CompareEntityIds(a->id, b->id) < 0; });

    ToonTable entities{"Entities", {}};
    ToonTable aliases{"Aliases", {}};
    ToonTable roles{"Roles", {}};
    ToonTable cases{"Cases", {}};
    ToonTable states{"States", {}};
    for (const Entity* e : ordered) {
        entities.records.push_back({{"id", e->id}, {"type", EntityTypeToString(e->type)}, {"name", e->name}});
        for (const auto& alias : e->aliases) {
            aliases.records.push_back({{"entity", e->id}, {"alias", alias}});
        }
        for (const auto& role : e->roles) {
            roles.records.push_back({{"entity", e->id}, {"role", role}});
        }
        for (const auto& caseId : e->involvedCases) {
            cases.records.push_back({{"entity", e->id}, {"case", caseId}});
        }
        for (const auto& [key, state] : e->states) {
            states.records.push_back({
                {"entity", e->id},
                {"key", key},
                {"value", state.value},
                {"timestamp", state.timestamp.rawText},
                {"case", state.caseId},
                {"confidence", state.confidence ? ToonValue(FormatDouble(*state.confidence)) : std::nullopt},
            });
        }
    }

    ToonTable events{"Events", {}};
    for (const auto& ev : workspace.events()) {
        events.records.push_back({
            {"id", ev.id},
            {"verb", ev.verb},
            {"agent", ev.agentId},
            {"patients", ToonCodec::JoinList(ev.patientIds)},
            {"temporal", OptionalText(ev.temporalId)},
            {"spatial", OptionalText(ev.spatialId)},
            {"implicit", std::string(ev.implicit ? "true" : "false")},
            {"case", ev.caseId},
        });
    }

    ToonTable questions{"Questions", {}};
    for (const auto& q : workspace.questions()) {
        questions.records.push_back({
            {"id", q.id},
            {"subject", OptionalText(q.subjectId)},
            {"text", q.text},
            {"answered", std::string(q.answered ? "true" : "false")},
            {"answer", OptionalText(q.answer)},
            {"source_case", q.sourceCaseId},
            {"answered_in_case", OptionalText(q.answeredInCaseId)},
        });
    }

    ToonTable ontology{"Ontology", {}};
    for (const auto& entry : workspace.ontology().entries()) {
        ontology.records.push_back({
            {"kind", TermKindToString(entry.kind)},
            {"term", entry.term},
            {"count", std::to_string(entry.count)},
        });
    }

    ToonTable vocabulary{"Vocabulary", {}};
    const auto& vocab = workspace.verbVocabulary();
    for (const auto& [value, count] : vocab.values()) {
        auto mapped = vocab.mappings().find(value);
        vocabulary.records.push_back({
            {"value", value},
            {"count", std::to_string(count)},
            {"canonical", mapped == vocab.mappings().end() ? std::nullopt : ToonValue(mapped->second)},
        });
    }

    return {meta, entities, aliases, roles, cases, states, events, questions, ontology, vocabulary};
}

std::string WorkspaceSnapshotCodec::Encode(const Workspace& workspace) {
    return ToonCodec::Encode(ToTables(workspace), std::string("casegraph workspace snapshot, schema ") + kSchemaTag);
}

Workspace WorkspaceSnapshotCodec::FromTables(const std::vector<ToonTable>& tables) {
    std::map<std::string, const ToonTable*> byName;
    for (const auto& table : tables) {
        if (!byName.emplace(table.name, &table).second) {
            throw SnapshotFormatError("duplicate table " + table.name);
        }
    }

    // Schema check comes first so an incompatible file is never partially read.
    const ToonTable& meta = RequireTable(byName, "Meta");
    if (meta.records.size() != 1) {
        throw SnapshotFormatError("Meta must hold exactly one record");
    }
    const ToonRecord& m = meta.records.front();
    const std::string schema = RequireField(m, "Meta", "schema");
    if (schema != kSchemaTag) {
        throw SnapshotSchemaMismatch(kSchemaTag, schema);
    }

    Workspace workspace(RequireField(m, "Meta", "domain"));
    Workspace::Counters counters;
    counters.version = RequireUnsigned(m, "Meta", "version");
    counters.documentCount = RequireUnsigned(m, "Meta", "document_count");
    counters.nextEntity = RequireUnsigned(m, "Meta", "next_entity");
    counters.nextEvent = RequireUnsigned(m, "Meta", "next_event");
    counters.nextQuestion = RequireUnsigned(m, "Meta", "next_question");

    for (const auto& r : RequireTable(byName, "Entities").records) {
        Entity entity;
        entity.id = RequireField(r, "Entities", "id");
        const std::string type = RequireField(r, "Entities", "type");
        auto parsed = EntityTypeFromString(type);
        if (!parsed) {
            throw SnapshotFormatError("entity " + entity.id + " has unknown type '" + type + "'");
        }
        entity.type = *parsed;
        entity.name = RequireField(r, "Entities", "name");
        if (entity.id.empty() || workspace.hasEntity(entity.id)) {
            throw SnapshotFormatError("empty or duplicate entity id '" + entity.id + "'");
        }
        workspace.insertEntity(std::move(entity));
    }

    // Aliases and roles are restored verbatim to keep first-seen order.
    for (const auto& r : RequireTable(byName, "Aliases").records) {
        OwnerOf(workspace, r, "Aliases").aliases.push_back(RequireField(r, "Aliases", "alias"));
    }
    for (const auto& r : RequireTable(byName, "Roles").records) {
        OwnerOf(workspace, r, "Roles").roles.push_back(RequireField(r, "Roles", "role"));
    }
    for (const auto& r : RequireTable(byName, "Cases").records) {
        OwnerOf(workspace, r, "Cases").involvedCases.insert(RequireField(r, "Cases", "case"));
    }
    for (const auto& r : RequireTable(byName, "States").records) {
        StateValue state;
        state.value = RequireField(r, "States", "value");
        state.timestamp = FuzzyDate::FromText(RequireField(r, "States", "timestamp"));
        state.caseId = RequireField(r, "States", "case");
        if (auto confidence = OptionalField(r, "States", "confidence")) {
            try {
                state.confidence = std::stod(*confidence);
            } catch (const std::exception&) {
                throw SnapshotFormatError("States.confidence is not a number: '" + *confidence + "'");
            }
        }
        OwnerOf(workspace, r, "States").states[RequireField(r, "States", "key")] = state;
    }

    for (const auto& r : RequireTable(byName, "Events").records) {
        Event event;
        event.id = RequireField(r, "Events", "id");
        event.verb = RequireField(r, "Events", "verb");
        event.agentId = RequireField(r, "Events", "agent");
        event.patientIds = ToonCodec::SplitList(RequireField(r, "Events", "patients"));
        event.temporalId = OptionalField(r, "Events", "temporal");
        event.spatialId = OptionalField(r, "Events", "spatial");
        event.implicit = RequireBool(r, "Events", "implicit");
        event.caseId = RequireField(r, "Events", "case");
        for (const auto& ref : event.references()) {
            if (!workspace.hasEntity(ref)) {
                throw SnapshotFormatError("event " + event.id + " refers to unknown entity '" + ref + "'");
            }
        }
        if (event.id.empty() || !workspace.appendEvent(std::move(event))) {
            throw SnapshotFormatError("empty or duplicate event in Events table");
        }
    }

    for (const auto& r : RequireTable(byName, "Questions").records) {
        Question q;
        q.id = RequireField(r, "Questions", "id");
        q.subjectId = OptionalField(r, "Questions", "subject");
        q.text = RequireField(r, "Questions", "text");
        q.answered = RequireBool(r, "Questions", "answered");
        q.answer = OptionalField(r, "Questions", "answer");
        q.sourceCaseId = RequireField(r, "Questions", "source_case");
        q.answeredInCaseId = OptionalField(r, "Questions", "answered_in_case");
        if (q.subjectId && !workspace.hasEntity(*q.subjectId)) {
            throw SnapshotFormatError("question " + q.id + " refers to unknown entity '" + *q.subjectId + "'");
        }
        if (q.answered && (!q.answer || q.answer->empty())) {
            throw SnapshotFormatError("question " + q.id + " is answered without an answer");
        }
        if (q.id.empty() || !workspace.appendQuestion(std::move(q))) {
            throw SnapshotFormatError("empty or duplicate question in Questions table");
        }
    }

    for (const auto& r : RequireTable(byName, "Ontology").records) {
        const std::string kindText = RequireField(r, "Ontology", "kind");
        auto kind = TermKindFromString(kindText);
        if (!kind) {
            throw SnapshotFormatError("unknown ontology kind '" + kindText + "'");
        }
        workspace.ontology().add(*kind, RequireField(r, "Ontology", "term"), RequireUnsigned(r, "Ontology", "count"));
    }

    // Runs after Events: appendEvent observed the verbs, the stored counts override them.
    const auto& vocabularyTable = RequireTable(byName, "Vocabulary");
    for (const auto& r : vocabularyTable.records) {
        if (auto canonical = OptionalField(r, "Vocabulary", "canonical")) {
            workspace.verbVocabulary().setCanonical(RequireField(r, "Vocabulary", "value"), *canonical);
        }
    }
    for (const auto& r : vocabularyTable.records) {
        workspace.verbVocabulary().restoreValue(RequireField(r, "Vocabulary", "value"),
                                                RequireUnsigned(r, "Vocabulary", "count"));
    }

    workspace.restoreCounters(counters);
    return workspace;
}

Workspace WorkspaceSnapshotCodec::Decode(const std::string& bytes) {
    std::vector<ToonTable> tables;
    try {
        tables = ToonCodec::Decode(bytes);
    } catch (const ToonParseError& e) {
        throw SnapshotFormatError(e.what());
    }
    return FromTables(tables);
}

} // namespace casegraph::infrastructure
