/**
 * @file JsonlDocumentSource.hpp
 * @brief Corpus adapter over a JSON Lines file (one document per line).
 */

#pragma once
#include <string>
#include <vector>
#include "domain/SourceDocument.hpp"

namespace casegraph::infrastructure {

/**
 * @class JsonlDocumentSource
 * @brief Loads `<domain>.jsonl` once; line N is document N.
 *
 * Text is taken from "text", "body" or "judgment"; the case id from "citation" or "version_id",
 * falling back to "doc-<index>". Undecodable lines keep their index and are marked unreadable.
 */
class JsonlDocumentSource : public domain::DocumentSource {
public:
    explicit JsonlDocumentSource(const std::string& path);

    /** @brief Reads the whole file. @return False if it cannot be opened. */
    bool load();

    size_t totalDocuments() const override { return m_documents.size(); }
    std::vector<domain::SourceDocument> fetch(size_t first, size_t count) const override;

    /** @brief Decodes one line. Exposed for tests. */
    static domain::SourceDocument ParseLine(const std::string& line, size_t index);

private:
    std::string m_path;
    std::vector<domain::SourceDocument> m_documents;
};

} // namespace casegraph::infrastructure
