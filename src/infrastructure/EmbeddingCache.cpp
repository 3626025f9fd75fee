/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include <fstream>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace casegraph::infrastructure {

EmbeddingCache::EmbeddingCache(const std::string& cacheFile, std::shared_ptr<PersistenceService> persistence)
    : m_cacheFile(cacheFile), m_persistence(std::move(persistence)) {}

void EmbeddingCache::update(const std::string& text, const std::string& model, const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[text] = {model, embedding};
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& text, const std::string& model) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(text);
    if (it != m_entries.end() && it->second.model == model) {
        return it->second.vector;
    }
    return std::nullopt;
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool EmbeddingCache::persist() {
    if (m_cacheFile.empty()) return false;

    json j = json::object();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [text, entry] : m_entries) {
            j[text] = { {"model", entry.model}, {"vector", entry.vector} };
        }
    }

    if (m_persistence) {
        return m_persistence->writeAtomic(m_cacheFile, j.dump()).get();
    }
    std::ofstream ofs(m_cacheFile);
    if (!ofs.is_open()) {
        std::cerr << "[EmbeddingCache] Cannot write " << m_cacheFile << std::endl;
        return false;
    }
    ofs << j.dump();
    return static_cast<bool>(ofs);
}

void EmbeddingCache::load() {
    if (m_cacheFile.empty() || !fs::exists(m_cacheFile)) return;

    std::ifstream f(m_cacheFile);
    if (!f.is_open()) return;

    std::map<std::string, CacheEntry> loaded;
    try {
        json j = json::parse(f);
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& value = it.value();
            if (value.is_object() && value.contains("model") && value.contains("vector")) {
                loaded[it.key()] = {value["model"].get<std::string>(), value["vector"].get<std::vector<float>>()};
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[EmbeddingCache] Ignoring unreadable cache " << m_cacheFile << ": " << e.what() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries = std::move(loaded);
}

} // namespace casegraph::infrastructure
