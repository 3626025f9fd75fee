/**
 * @file WorkspacePersister.hpp
 * @brief Persist capability handed to the Mode Controller.
 */

#pragma once
#include <string>
#include "domain/IngestionCursor.hpp"

namespace casegraph::domain {

/**
 * @class WorkspacePersister
 * @brief Durable side effects of a committed batch. Production writes files; calibration writes nothing.
 */
class WorkspacePersister {
public:
    virtual ~WorkspacePersister() = default;

    /** @return True once the snapshot is durable. */
    virtual bool persistSnapshot(const std::string& domain, const std::string& snapshotBytes) = 0;

    /** @return True once the cursor is durable. */
    virtual bool persistCursor(const IngestionCursor& cursor) = 0;

    /** @brief False for the calibration capability. */
    virtual bool isDurable() const = 0;
};

/**
 * @class NullWorkspacePersister
 * @brief Calibration capability: accepts everything, writes nothing.
 */
class NullWorkspacePersister : public WorkspacePersister {
public:
    bool persistSnapshot(const std::string&, const std::string&) override { return true; }
    bool persistCursor(const IngestionCursor&) override { return true; }
    bool isDurable() const override { return false; }
};

} // namespace casegraph::domain
