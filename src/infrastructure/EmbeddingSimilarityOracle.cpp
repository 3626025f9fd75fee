/**
 * @file EmbeddingSimilarityOracle.cpp
 * @brief Implementation of EmbeddingSimilarityOracle.
 */

#include "infrastructure/EmbeddingSimilarityOracle.hpp"
#include <algorithm>
#include <cmath>

namespace casegraph::infrastructure {

EmbeddingSimilarityOracle::EmbeddingSimilarityOracle(Embedder embedder, std::string model,
                                                     std::shared_ptr<EmbeddingCache> cache)
    : m_embedder(std::move(embedder)), m_model(std::move(model)), m_cache(std::move(cache)) {}

std::shared_ptr<EmbeddingSimilarityOracle> EmbeddingSimilarityOracle::ForOllama(std::shared_ptr<OllamaClient> client,
                                                                                const std::string& model,
                                                                                std::shared_ptr<EmbeddingCache> cache) {
    Embedder embedder = [client, model](const std::string& text) { return client->getEmbedding(model, text); };
    return std::make_shared<EmbeddingSimilarityOracle>(std::move(embedder), model, std::move(cache));
}

std::string EmbeddingSimilarityOracle::EntityText(const domain::Entity& entity) {
    std::string text = domain::EntityTypeToString(entity.type) + ": " + entity.name;
    std::string others;
    for (const auto& alias : entity.aliases) {
        if (alias == entity.name) continue;
        if (!others.empty()) others += ", ";
        others += alias;
    }
    if (!others.empty()) text += " (" + others + ")";
    return text;
}

std::optional<double> EmbeddingSimilarityOracle::Cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return std::nullopt;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) return std::nullopt;
    return std::clamp(dot / (std::sqrt(na) * std::sqrt(nb)), 0.0, 1.0);
}

std::optional<std::vector<float>> EmbeddingSimilarityOracle::embed(const std::string& text) {
    if (m_cache) {
        if (auto cached = m_cache->get(text, m_model)) return cached;
    }
    std::vector<float> vector = m_embedder(text);
    if (vector.empty()) return std::nullopt;
    if (m_cache) m_cache->update(text, m_model, vector);
    return vector;
}

std::optional<double> EmbeddingSimilarityOracle::score(const domain::Entity& candidate, const domain::Entity& existing) {
    auto a = embed(EntityText(candidate));
    if (!a) return std::nullopt;
    auto b = embed(EntityText(existing));
    if (!b) return std::nullopt;
    return Cosine(*a, *b);
}

} // namespace casegraph::infrastructure
