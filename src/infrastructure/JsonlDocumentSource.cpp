/**
 * @file JsonlDocumentSource.cpp
 * @brief Implementation of JsonlDocumentSource.
 */

#include "infrastructure/JsonlDocumentSource.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace casegraph::infrastructure {

namespace {

std::string FirstString(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // namespace

JsonlDocumentSource::JsonlDocumentSource(const std::string& path) : m_path(path) {}

domain::SourceDocument JsonlDocumentSource::ParseLine(const std::string& line, size_t index) {
    domain::SourceDocument doc;
    doc.index = index;
    try {
        json j = json::parse(line);
        if (!j.is_object()) {
            doc.readable = false;
        } else {
            doc.text = FirstString(j, {"text", "body", "judgment"});
            doc.caseId = FirstString(j, {"citation", "version_id", "case_id"});
        }
    } catch (const json::parse_error& e) {
        std::cerr << "[JsonlDocumentSource] Line " << index + 1 << " is not JSON: " << e.what() << std::endl;
        doc.readable = false;
    }
    if (doc.caseId.empty()) doc.caseId = "doc-" + std::to_string(index);
    return doc;
}

bool JsonlDocumentSource::load() {
    std::ifstream f(m_path);
    if (!f.is_open()) {
        std::cerr << "[JsonlDocumentSource] Cannot open " << m_path << std::endl;
        return false;
    }

    m_documents.clear();
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Blank lines are not documents; indices stay dense.
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        m_documents.push_back(ParseLine(line, m_documents.size()));
    }
    std::cout << "[JsonlDocumentSource] " << m_documents.size() << " documents in " << m_path << std::endl;
    return true;
}

std::vector<domain::SourceDocument> JsonlDocumentSource::fetch(size_t first, size_t count) const {
    std::vector<domain::SourceDocument> out;
    if (first >= m_documents.size()) return out;
    size_t last = std::min(m_documents.size(), first + count);
    out.assign(m_documents.begin() + static_cast<std::ptrdiff_t>(first),
               m_documents.begin() + static_cast<std::ptrdiff_t>(last));
    return out;
}

} // namespace casegraph::infrastructure
