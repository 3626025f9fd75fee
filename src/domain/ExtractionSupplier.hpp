/**
 * @file ExtractionSupplier.hpp
 * @brief Interface for the external language-model extraction step.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Candidate.hpp"

namespace casegraph::domain {

/**
 * @class ExtractionSupplier
 * @brief Turns a document into actors, roles, states, verb phrases and questions.
 */
class ExtractionSupplier {
public:
    virtual ~ExtractionSupplier() = default;

    /**
     * @brief Extracts candidates from one document.
     * @param documentText Raw text.
     * @param chunkId Identifier of the chunk being extracted.
     * @param ontologyContext Optional summary of frequent terms, pulled from the Ontology Aggregator.
     * @return Extraction without provenance (the core attaches the case id), or nullopt on failure.
     */
    virtual std::optional<ChunkExtraction> extract(const std::string& documentText,
                                                   const std::string& chunkId,
                                                   const std::optional<std::string>& ontologyContext) = 0;
};

} // namespace casegraph::domain
