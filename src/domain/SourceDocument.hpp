/**
 * @file SourceDocument.hpp
 * @brief Domain entity representing one corpus document, and the source that serves them.
 */

#pragma once
#include <string>
#include <vector>

namespace casegraph::domain {

/**
 * @class SourceDocument
 * @brief A document at a fixed position of a domain corpus.
 */
class SourceDocument {
public:
    size_t index = 0;          ///< Position in the corpus; the cursor counts in these.
    std::string caseId;        ///< Provenance attached to everything extracted from it.
    std::string text;
    bool readable = true;      ///< False if the stored record could not be decoded.
};

/**
 * @class DocumentSource
 * @brief Random access to a domain corpus by index range.
 */
class DocumentSource {
public:
    virtual ~DocumentSource() = default;

    virtual size_t totalDocuments() const = 0;

    /** @brief Documents [first, first + count), clipped to the corpus end. */
    virtual std::vector<SourceDocument> fetch(size_t first, size_t count) const = 0;
};

} // namespace casegraph::domain
