/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Provides a unified way to access resolver, batching and Ollama settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <optional>
#include "domain/EntityResolver.hpp"

namespace casegraph::infrastructure {

/**
 * @struct EngineConfig
 * @brief Every key is optional in settings.json; these are the defaults.
 */
struct EngineConfig {
    double similarityThreshold = 0.85;
    int oracleTimeoutMs = 2000;
    size_t resolveWorkers = 4;
    domain::StateTiePolicy tiePolicy = domain::StateTiePolicy::ExtractionOrder;
    size_t batchSize = 10;
    std::string dataDir;                 ///< Empty means PathUtils::GetWorkspacesDir().
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "qwen2.5:7b";
    std::string embeddingModel = "bge-m3";

    domain::ResolverSettings resolverSettings() const;

    /** @brief dataDir, or the XDG default when unset. */
    std::string workspacesDir() const;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p configDir.
     * @return Defaults when the file is missing or unreadable; invalid keys fall back individually.
     */
    static EngineConfig Load(const std::string& configDir);

    /** @brief Same rules as Load, from JSON text. */
    static EngineConfig Parse(const std::string& jsonText);
};

} // namespace casegraph::infrastructure
