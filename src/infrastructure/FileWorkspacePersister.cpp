/**
 * @file FileWorkspacePersister.cpp
 * @brief Implementation of FileWorkspacePersister.
 */

#include "infrastructure/FileWorkspacePersister.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace casegraph::infrastructure {

FileWorkspacePersister::FileWorkspacePersister(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_dataDir(std::move(dataDir)), m_persistence(std::move(persistence)), m_tracker(m_dataDir, m_persistence) {}

std::string FileWorkspacePersister::snapshotPath(const std::string& domain) const {
    return (fs::path(m_dataDir) / (domain + "_workspace.toon")).string();
}

bool FileWorkspacePersister::persistSnapshot(const std::string& domain, const std::string& snapshotBytes) {
    if (!m_persistence) return false;
    const std::string path = snapshotPath(domain);
    bool ok = m_persistence->writeAtomic(path, snapshotBytes).get();
    if (!ok) {
        std::cerr << "[FileWorkspacePersister] Snapshot write failed: " << path << std::endl;
    }
    return ok;
}

bool FileWorkspacePersister::persistCursor(const domain::IngestionCursor& cursor) {
    return m_tracker.save(cursor);
}

std::optional<std::string> FileWorkspacePersister::loadSnapshot(const std::string& domain) const {
    const std::string path = snapshotPath(domain);
    if (!fs::exists(path)) return std::nullopt;

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw std::runtime_error("cannot read snapshot " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // namespace casegraph::infrastructure
