/**
 * @file ExtractionParser.cpp
 * @brief Implementation of ExtractionParser.
 */

#include "infrastructure/ExtractionParser.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace casegraph::infrastructure {

namespace {

std::string Text(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end()) continue;
        if (it->is_string()) return it->get<std::string>();
        if (it->is_number_integer()) return std::to_string(it->get<long long>());
    }
    return "";
}

std::optional<std::string> OptionalText(const json& j, const char* key) {
    std::string value = Text(j, {key});
    if (value.empty()) return std::nullopt;
    return value;
}

std::vector<std::string> Strings(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& item : *it) {
        if (item.is_string() && !item.get<std::string>().empty()) out.push_back(item.get<std::string>());
    }
    return out;
}

const json* Array(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) return nullptr;
    return &*it;
}

} // namespace

std::string ExtractionParser::StripCodeFence(const std::string& reply) {
    size_t start = reply.find("```");
    if (start == std::string::npos) return reply;
    size_t bodyStart = reply.find('\n', start);
    if (bodyStart == std::string::npos) return reply;
    size_t end = reply.find("```", bodyStart);
    if (end == std::string::npos) return reply.substr(bodyStart + 1);
    return reply.substr(bodyStart + 1, end - bodyStart - 1);
}

ExtractionParseResult ExtractionParser::Parse(const std::string& reply, const std::string& chunkId) {
    ExtractionParseResult result;

    json root;
    try {
        root = json::parse(StripCodeFence(reply));
    } catch (const json::parse_error& e) {
        result.errors.push_back(chunkId + ": reply is not JSON: " + e.what());
        return result;
    }
    if (!root.is_object()) {
        result.errors.push_back(chunkId + ": reply is not a JSON object");
        return result;
    }

    domain::ChunkExtraction extraction;
    extraction.chunkId = chunkId;

    if (const json* actors = Array(root, "actors")) {
        for (const auto& a : *actors) {
            if (!a.is_object()) {
                ++result.malformedItems;
                continue;
            }
            domain::CandidateEntity entity;
            entity.localId = Text(a, {"id"});
            entity.name = Text(a, {"name"});
            entity.type = Text(a, {"actor_type", "type"});
            if (entity.type.empty()) entity.type = "person";
            entity.aliases = Strings(a, "aliases");
            entity.roles = Strings(a, "roles");
            if (const json* states = Array(a, "states")) {
                for (const auto& s : *states) {
                    if (!s.is_object()) {
                        ++result.malformedItems;
                        continue;
                    }
                    domain::CandidateState state;
                    state.key = Text(s, {"name", "key"});
                    state.value = Text(s, {"value"});
                    state.rawTimestamp = Text(s, {"start_date", "timestamp", "date"});
                    auto conf = s.find("confidence");
                    if (conf != s.end() && conf->is_number()) state.confidence = conf->get<double>();
                    entity.states.push_back(std::move(state));
                }
            }
            extraction.entities.push_back(std::move(entity));
        }
    }

    if (const json* verbs = Array(root, "verb_phrases")) {
        for (const auto& v : *verbs) {
            if (!v.is_object()) {
                ++result.malformedItems;
                continue;
            }
            domain::CandidateEvent event;
            event.verb = Text(v, {"verb"});
            event.agentRef = Text(v, {"agent_id", "agent"});
            event.patientRefs = Strings(v, "patient_ids");
            event.temporalRef = OptionalText(v, "temporal_id");
            event.spatialRef = OptionalText(v, "spatial_id");
            auto implicit = v.find("is_implicit");
            event.implicit = implicit != v.end() && implicit->is_boolean() && implicit->get<bool>();
            extraction.events.push_back(std::move(event));
        }
    }

    if (const json* questions = Array(root, "questions")) {
        for (const auto& q : *questions) {
            if (!q.is_object()) {
                ++result.malformedItems;
                continue;
            }
            domain::CandidateQuestion question;
            question.text = Text(q, {"question_text", "text"});
            question.subjectRef = OptionalText(q, "target_entity_id");
            extraction.questions.push_back(std::move(question));
        }
    }

    if (const json* answers = Array(root, "answered_questions")) {
        for (const auto& a : *answers) {
            if (!a.is_object()) {
                ++result.malformedItems;
                continue;
            }
            extraction.answers.push_back({Text(a, {"question_id"}), Text(a, {"answer_text", "answer"})});
        }
    }

    extraction.droppedQuestionIds = Strings(root, "dropped_questions");

    extraction.malformedItems = result.malformedItems;
    result.extraction = std::move(extraction);
    return result;
}

} // namespace casegraph::infrastructure
