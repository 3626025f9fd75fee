/**
 * @file EmbeddingCache.hpp
 * @brief Persistence for alias embeddings.
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include "infrastructure/PersistenceService.hpp"

namespace casegraph::infrastructure {

/**
 * @class EmbeddingCache
 * @brief Caches embeddings per text so repeated entity comparisons do not hit the model again.
 *
 * Entries are keyed by text and tagged with the embedding model; a different model misses.
 * Thread-safe: the resolve phase reads and fills it from several workers.
 */
class EmbeddingCache {
public:
    /** @param cacheFile JSON file; empty keeps the cache in memory only. */
    explicit EmbeddingCache(const std::string& cacheFile, std::shared_ptr<PersistenceService> persistence = nullptr);

    /** @brief Updates or adds an embedding to the cache. */
    void update(const std::string& text, const std::string& model, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding if it was computed with @p model. */
    std::optional<std::vector<float>> get(const std::string& text, const std::string& model) const;

    size_t size() const;

    /** @brief Saves the cache through PersistenceService (or directly when none is set). */
    bool persist();

    /** @brief Loads the cache from disk. Unreadable files leave the cache empty. */
    void load();

private:
    std::string m_cacheFile;
    std::shared_ptr<PersistenceService> m_persistence;
    struct CacheEntry {
        std::string model;
        std::vector<float> vector;
    };
    std::map<std::string, CacheEntry> m_entries;
    mutable std::mutex m_mutex;
};

} // namespace casegraph::infrastructure
