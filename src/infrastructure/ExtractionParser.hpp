/**
 * @file ExtractionParser.hpp
 * @brief Turns the extraction model's JSON reply into a ChunkExtraction.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Candidate.hpp"

namespace casegraph::infrastructure {

/**
 * @struct ExtractionParseResult
 */
struct ExtractionParseResult {
    std::optional<domain::ChunkExtraction> extraction;   ///< nullopt if the reply is not a JSON object.
    size_t malformedItems = 0;                           ///< Entries skipped because of their shape.
    std::vector<std::string> errors;
};

/**
 * @class ExtractionParser
 * @brief Lenient reader: wrong-typed entries are skipped and counted, never fatal.
 *
 * Expected reply:
 * @code
 * {"actors":[{"id","name","actor_type","aliases":[],"roles":[],
 *             "states":[{"name","value","start_date","confidence"}]}],
 *  "verb_phrases":[{"verb","agent_id","patient_ids":[],"temporal_id","spatial_id","is_implicit"}],
 *  "questions":[{"question_text","target_entity_id"}],
 *  "answered_questions":[{"question_id","answer_text"}],
 *  "dropped_questions":["Q3"]}
 * @endcode
 */
class ExtractionParser {
public:
    static ExtractionParseResult Parse(const std::string& reply, const std::string& chunkId);

    /** @brief Removes a surrounding ```json fence if the model added one. */
    static std::string StripCodeFence(const std::string& reply);
};

} // namespace casegraph::infrastructure
