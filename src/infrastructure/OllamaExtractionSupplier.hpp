/**
 * @file OllamaExtractionSupplier.hpp
 * @brief Extraction supplier that asks an Ollama model for JSON and parses it.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/ExtractionSupplier.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace casegraph::infrastructure {

/**
 * @class OllamaExtractionSupplier
 * @brief JSON-mode generation followed by ExtractionParser.
 */
class OllamaExtractionSupplier : public domain::ExtractionSupplier {
public:
    OllamaExtractionSupplier(std::shared_ptr<OllamaClient> client, std::string model);

    std::optional<domain::ChunkExtraction> extract(const std::string& documentText,
                                                   const std::string& chunkId,
                                                   const std::optional<std::string>& ontologyContext) override;

    /** @brief System prompt with the reply schema and, when given, the context block. */
    static std::string BuildSystemPrompt(const std::optional<std::string>& ontologyContext);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
};

} // namespace casegraph::infrastructure
