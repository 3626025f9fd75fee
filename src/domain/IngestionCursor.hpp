/**
 * @file IngestionCursor.hpp
 * @brief Durable "what to process next" position of a production run.
 */

#pragma once
#include <string>

namespace casegraph::domain {

/**
 * @struct IngestionCursor
 * @brief Documents [0, lastCommittedIndex) are committed; processing resumes at lastCommittedIndex.
 */
struct IngestionCursor {
    std::string domain;
    size_t lastCommittedIndex = 0;
    size_t batchSize = 10;
    size_t totalDocuments = 0;

    bool exhausted() const { return totalDocuments > 0 && lastCommittedIndex >= totalDocuments; }

    bool operator==(const IngestionCursor& o) const {
        return domain == o.domain && lastCommittedIndex == o.lastCommittedIndex && batchSize == o.batchSize &&
               totalDocuments == o.totalDocuments;
    }
    bool operator!=(const IngestionCursor& o) const { return !(*this == o); }
};

} // namespace casegraph::domain
