/**
 * @file IngestionStateTracker.cpp
 * @brief Implementation of IngestionStateTracker.
 */

#include "infrastructure/IngestionStateTracker.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace casegraph::infrastructure {

IngestionStateTracker::IngestionStateTracker(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_dataDir(std::move(dataDir)), m_persistence(std::move(persistence)) {}

std::string IngestionStateTracker::pathFor(const std::string& domain) const {
    return (fs::path(m_dataDir) / (domain + "_state.json")).string();
}

std::string IngestionStateTracker::Serialize(const domain::IngestionCursor& cursor) {
    json j = {
        {"domain", cursor.domain},
        {"last_committed_index", cursor.lastCommittedIndex},
        {"batch_size", cursor.batchSize},
        {"total_documents", cursor.totalDocuments}
    };
    return j.dump(2);
}

std::optional<domain::IngestionCursor> IngestionStateTracker::Deserialize(const std::string& text) {
    try {
        json j = json::parse(text);
        domain::IngestionCursor cursor;
        cursor.domain = j.at("domain").get<std::string>();
        if (!j.at("last_committed_index").is_number_unsigned()) {
            std::cerr << "[IngestionStateTracker] Invalid cursor: last_committed_index is not a count" << std::endl;
            return std::nullopt;
        }
        cursor.lastCommittedIndex = j.at("last_committed_index").get<size_t>();
        cursor.batchSize = j.value("batch_size", cursor.batchSize);
        cursor.totalDocuments = j.value("total_documents", cursor.totalDocuments);
        return cursor;
    } catch (const json::exception& e) {
        std::cerr << "[IngestionStateTracker] Invalid cursor: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::IngestionCursor> IngestionStateTracker::load(const std::string& domain) const {
    const std::string path = pathFor(domain);
    if (!fs::exists(path)) return std::nullopt;

    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[IngestionStateTracker] Cannot open " << path << std::endl;
        return std::nullopt;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    auto cursor = Deserialize(text);
    if (cursor && cursor->domain != domain) {
        std::cerr << "[IngestionStateTracker] " << path << " belongs to domain '" << cursor->domain
                  << "', ignoring it" << std::endl;
        return std::nullopt;
    }
    if (cursor) {
        std::cout << "[IngestionStateTracker] Resuming '" << domain << "' at document "
                  << cursor->lastCommittedIndex << std::endl;
    }
    return cursor;
}

domain::IngestionCursor IngestionStateTracker::loadOrCreate(const std::string& domain, size_t batchSize) const {
    if (auto cursor = load(domain)) {
        cursor->batchSize = batchSize;
        return *cursor;
    }
    domain::IngestionCursor fresh;
    fresh.domain = domain;
    fresh.batchSize = batchSize;
    return fresh;
}

bool IngestionStateTracker::save(const domain::IngestionCursor& cursor) {
    if (!m_persistence) return false;
    bool ok = m_persistence->writeAtomic(pathFor(cursor.domain), Serialize(cursor)).get();
    if (!ok) {
        std::cerr << "[IngestionStateTracker] Cursor write failed for '" << cursor.domain << "'" << std::endl;
    }
    return ok;
}

} // namespace casegraph::infrastructure
