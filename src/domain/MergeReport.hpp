/**
 * @file MergeReport.hpp
 * @brief Outcome of one AppendBatch call.
 */

#pragma once
#include <string>
#include <vector>

namespace casegraph::domain {

/**
 * @struct MergeDecision
 * @brief What the resolver decided for one candidate entity, and what apply did with it.
 */
struct MergeDecision {
    enum class Kind { CreateNew, MergeInto, Dropped };

    size_t chunkIndex = 0;
    std::string localId;
    Kind kind = Kind::CreateNew;
    std::string entityId;     ///< Final workspace id (empty when dropped).
    double score = 0.0;       ///< Best oracle score seen; 1.0 for exact alias matches.
    bool exactMatch = false;
    bool degraded = false;    ///< Oracle unavailable, exact-alias-only.

    static std::string KindToString(Kind k) {
        switch (k) {
            case Kind::CreateNew: return "create";
            case Kind::MergeInto: return "merge";
            case Kind::Dropped: return "dropped";
        }
        return "create";
    }

    bool operator==(const MergeDecision& o) const {
        return chunkIndex == o.chunkIndex && localId == o.localId && kind == o.kind && entityId == o.entityId &&
               score == o.score && exactMatch == o.exactMatch && degraded == o.degraded;
    }
};

/**
 * @struct MergeReport
 */
struct MergeReport {
    size_t newEntities = 0;
    size_t mergedEntities = 0;
    size_t newEvents = 0;
    size_t newQuestions = 0;
    size_t answeredQuestions = 0;
    size_t droppedQuestions = 0;
    size_t degradedMatches = 0;
    size_t malformedCandidates = 0;
    std::vector<MergeDecision> decisions;

    bool operator==(const MergeReport& o) const {
        return newEntities == o.newEntities && mergedEntities == o.mergedEntities && newEvents == o.newEvents &&
               newQuestions == o.newQuestions && answeredQuestions == o.answeredQuestions &&
               droppedQuestions == o.droppedQuestions && degradedMatches == o.degradedMatches &&
               malformedCandidates == o.malformedCandidates && decisions == o.decisions;
    }
    bool operator!=(const MergeReport& o) const { return !(*this == o); }
};

} // namespace casegraph::domain
