/**
 * @file IngestionStateTracker.hpp
 * @brief Durable batch cursor stored as <data_dir>/<domain>_state.json.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "domain/IngestionCursor.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace casegraph::infrastructure {

/**
 * @class IngestionStateTracker
 * @brief Reads the cursor once at start-up and writes it after each confirmed snapshot.
 */
class IngestionStateTracker {
public:
    IngestionStateTracker(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

    /**
     * @brief Loads the cursor of @p domain.
     * @return nullopt if no cursor file exists yet or it cannot be parsed (logged).
     */
    std::optional<domain::IngestionCursor> load(const std::string& domain) const;

    /** @brief Loaded cursor, or a fresh one at index 0. */
    domain::IngestionCursor loadOrCreate(const std::string& domain, size_t batchSize) const;

    /** @brief Atomic write; blocks until the rename is confirmed. */
    bool save(const domain::IngestionCursor& cursor);

    std::string pathFor(const std::string& domain) const;

    static std::string Serialize(const domain::IngestionCursor& cursor);
    static std::optional<domain::IngestionCursor> Deserialize(const std::string& text);

private:
    std::string m_dataDir;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace casegraph::infrastructure
