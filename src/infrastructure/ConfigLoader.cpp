/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <iterator>
#include "infrastructure/PathUtils.hpp"

namespace casegraph::infrastructure {

namespace {

constexpr const char* kSettingsFile = "settings.json";

void Reject(const std::string& key) {
    std::cerr << "[ConfigLoader] Invalid value for '" << key << "', using default" << std::endl;
}

template <typename T, typename Valid>
void ReadKey(const nlohmann::json& j, const std::string& key, T& target, Valid valid) {
    if (!j.contains(key)) return;
    try {
        T value = j.at(key).get<T>();
        if (valid(value)) {
            target = value;
            return;
        }
    } catch (const nlohmann::json::exception&) {
    }
    Reject(key);
}

EngineConfig FromJson(const nlohmann::json& j) {
    EngineConfig config;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
        return config;
    }

    ReadKey(j, "similarity_threshold", config.similarityThreshold, [](double v) { return v >= 0.0 && v <= 1.0; });
    ReadKey(j, "oracle_timeout_ms", config.oracleTimeoutMs, [](int v) { return v >= 0; });
    ReadKey(j, "resolve_workers", config.resolveWorkers, [](size_t v) { return v >= 1 && v <= 256; });
    ReadKey(j, "batch_size", config.batchSize, [](size_t v) { return v >= 1 && v <= 100000; });
    ReadKey(j, "data_dir", config.dataDir, [](const std::string&) { return true; });
    ReadKey(j, "ollama_host", config.ollamaHost, [](const std::string& v) { return !v.empty(); });
    ReadKey(j, "ollama_port", config.ollamaPort, [](int v) { return v > 0 && v < 65536; });
    ReadKey(j, "ollama_model", config.ollamaModel, [](const std::string& v) { return !v.empty(); });
    ReadKey(j, "embedding_model", config.embeddingModel, [](const std::string& v) { return !v.empty(); });

    std::string policy = domain::StateTiePolicyToString(config.tiePolicy);
    ReadKey(j, "state_tie_policy", policy,
            [](const std::string& v) { return domain::StateTiePolicyFromString(v).has_value(); });
    config.tiePolicy = *domain::StateTiePolicyFromString(policy);

    return config;
}

} // namespace

domain::ResolverSettings EngineConfig::resolverSettings() const {
    domain::ResolverSettings settings;
    settings.similarityThreshold = similarityThreshold;
    settings.oracleTimeout = std::chrono::milliseconds(oracleTimeoutMs);
    settings.tiePolicy = tiePolicy;
    return settings;
}

std::string EngineConfig::workspacesDir() const {
    if (!dataDir.empty()) return dataDir;
    return PathUtils::GetWorkspacesDir().string();
}

EngineConfig ConfigLoader::Parse(const std::string& jsonText) {
    try {
        return FromJson(nlohmann::json::parse(jsonText));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error parsing settings.json: " << e.what() << std::endl;
    }
    return EngineConfig{};
}

EngineConfig ConfigLoader::Load(const std::string& configDir) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / kSettingsFile;
    if (!std::filesystem::exists(configPath)) {
        return EngineConfig{};
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << std::endl;
        return EngineConfig{};
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return Parse(text);
}

} // namespace casegraph::infrastructure
