/**
 * @file OllamaExtractionSupplier.cpp
 * @brief Implementation of OllamaExtractionSupplier.
 */

#include "infrastructure/OllamaExtractionSupplier.hpp"
#include <iostream>
#include "infrastructure/ExtractionParser.hpp"

namespace casegraph::infrastructure {

namespace {

const char* kExtractionPrompt = R"(You extract a knowledge graph from one court document.
Return only a JSON object with these keys:
{
  "actors": [{"id": "a1", "name": "John Smith", "actor_type": "person|organization|location|temporal|asset",
              "aliases": ["the husband"], "roles": ["husband", "applicant"],
              "states": [{"name": "employment", "value": "accountant", "start_date": "2020-03-15"}]}],
  "verb_phrases": [{"verb": "filed", "agent_id": "a1", "patient_ids": ["a2"],
                    "temporal_id": "a3", "spatial_id": null, "is_implicit": false}],
  "questions": [{"question_text": "When did the parties separate?", "target_entity_id": "a1"}],
  "answered_questions": [{"question_id": "Q4", "answer_text": "In March 2020"}],
  "dropped_questions": []
}
Rules:
- Every date mentioned becomes an actor of type "temporal" named by the date text.
- verb_phrases reference actor ids from this reply.
- Only state what the text says; leave states out when unsure.
- Answer an open question only if this document answers it.)";

} // namespace

OllamaExtractionSupplier::OllamaExtractionSupplier(std::shared_ptr<OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

std::string OllamaExtractionSupplier::BuildSystemPrompt(const std::optional<std::string>& ontologyContext) {
    std::string prompt = kExtractionPrompt;
    if (ontologyContext && !ontologyContext->empty()) {
        prompt += "\n\nReuse these established terms (TOON tables) where they fit:\n";
        prompt += *ontologyContext;
    }
    return prompt;
}

std::optional<domain::ChunkExtraction> OllamaExtractionSupplier::extract(const std::string& documentText,
                                                                         const std::string& chunkId,
                                                                         const std::optional<std::string>& ontologyContext) {
    if (!m_client) return std::nullopt;

    auto reply = m_client->generate(m_model, BuildSystemPrompt(ontologyContext), documentText, true);
    if (!reply) {
        std::cerr << "[OllamaExtractionSupplier] No reply for " << chunkId << std::endl;
        return std::nullopt;
    }

    auto parsed = ExtractionParser::Parse(*reply, chunkId);
    for (const auto& error : parsed.errors) {
        std::cerr << "[OllamaExtractionSupplier] " << error << std::endl;
    }
    if (parsed.malformedItems) {
        std::cerr << "[OllamaExtractionSupplier] Skipped " << parsed.malformedItems << " malformed item(s) in "
                  << chunkId << std::endl;
    }
    return parsed.extraction;
}

} // namespace casegraph::infrastructure
