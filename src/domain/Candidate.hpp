/**
 * @file Candidate.hpp
 * @brief Unmerged proposals produced by one extraction call, and the batch that groups them.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Entity.hpp"

namespace casegraph::domain {

/**
 * @struct CandidateState
 * @brief State proposed for a candidate entity, timestamp still raw.
 */
struct CandidateState {
    std::string key;
    std::string value;
    std::string rawTimestamp;
    std::optional<double> confidence;
};

/**
 * @struct CandidateEntity
 * @brief Entity as extracted. The type stays a raw string until validation.
 */
struct CandidateEntity {
    std::string localId;   ///< Unique within its chunk.
    std::string type;
    std::string name;
    std::vector<std::string> aliases;
    std::vector<std::string> roles;
    std::vector<CandidateState> states;
};

/**
 * @struct CandidateEvent
 * @brief References are chunk-local ids or existing workspace entity ids.
 */
struct CandidateEvent {
    std::string verb;
    std::string agentRef;
    std::vector<std::string> patientRefs;
    std::optional<std::string> temporalRef;
    std::optional<std::string> spatialRef;
    bool implicit = false;
};

/** @brief New open question proposed by the chunk. */
struct CandidateQuestion {
    std::optional<std::string> subjectRef;
    std::string text;
};

/** @brief Answer to an already stored question. */
struct QuestionAnswer {
    std::string questionId;
    std::string answerText;
};

/**
 * @struct ChunkExtraction
 * @brief Output of one extraction call, with provenance attached by the core.
 */
struct ChunkExtraction {
    std::string caseId;
    std::string chunkId;
    std::vector<CandidateEntity> entities;
    std::vector<CandidateEvent> events;
    std::vector<CandidateQuestion> questions;
    std::vector<QuestionAnswer> answers;
    std::vector<std::string> droppedQuestionIds;
    size_t malformedItems = 0; ///< Items the supplier discarded before they became candidates.
};

/**
 * @struct ExtractionBatch
 * @brief A run of consecutive documents, applied all-or-nothing.
 */
struct ExtractionBatch {
    size_t firstDocumentIndex = 0;
    size_t documentCount = 0;
    std::vector<ChunkExtraction> chunks;
};

} // namespace casegraph::domain
