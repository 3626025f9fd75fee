/**
 * @file FileWorkspacePersister.hpp
 * @brief Production persist capability: snapshot and cursor files under the data directory.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "domain/WorkspacePersister.hpp"
#include "infrastructure/IngestionStateTracker.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace casegraph::infrastructure {

/**
 * @class FileWorkspacePersister
 * @brief Writes <data_dir>/<domain>_workspace.toon and the cursor file through PersistenceService.
 *
 * Every persist call blocks until the rename is confirmed, so a true return means durable.
 */
class FileWorkspacePersister : public domain::WorkspacePersister {
public:
    FileWorkspacePersister(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

    bool persistSnapshot(const std::string& domain, const std::string& snapshotBytes) override;
    bool persistCursor(const domain::IngestionCursor& cursor) override;
    bool isDurable() const override { return true; }

    /**
     * @brief Raw snapshot bytes, or nullopt if the domain has no snapshot yet.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    std::optional<std::string> loadSnapshot(const std::string& domain) const;

    std::string snapshotPath(const std::string& domain) const;
    IngestionStateTracker& stateTracker() { return m_tracker; }
    const IngestionStateTracker& stateTracker() const { return m_tracker; }

private:
    std::string m_dataDir;
    std::shared_ptr<PersistenceService> m_persistence;
    IngestionStateTracker m_tracker;
};

} // namespace casegraph::infrastructure
