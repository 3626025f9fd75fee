/**
 * @file EmbeddingSimilarityOracle.hpp
 * @brief Similarity oracle backed by text embeddings (cosine similarity).
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/SimilarityOracle.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace casegraph::infrastructure {

/**
 * @class EmbeddingSimilarityOracle
 * @brief Embeds a textual rendering of each entity and scores pairs by cosine similarity.
 *
 * An empty embedding means the model is unavailable; score() then returns nullopt and the
 * resolver degrades the candidate.
 */
class EmbeddingSimilarityOracle : public domain::SimilarityOracle {
public:
    using Embedder = std::function<std::vector<float>(const std::string& text)>;

    EmbeddingSimilarityOracle(Embedder embedder, std::string model, std::shared_ptr<EmbeddingCache> cache = nullptr);

    /** @brief Oracle using Ollama's /api/embeddings. */
    static std::shared_ptr<EmbeddingSimilarityOracle> ForOllama(std::shared_ptr<OllamaClient> client,
                                                                const std::string& model,
                                                                std::shared_ptr<EmbeddingCache> cache = nullptr);

    std::optional<double> score(const domain::Entity& candidate, const domain::Entity& existing) override;

    /** @brief "<type>: <name> (alias, alias)". */
    static std::string EntityText(const domain::Entity& entity);

    /** @brief Cosine similarity clamped to [0,1]; nullopt on empty or mismatched vectors. */
    static std::optional<double> Cosine(const std::vector<float>& a, const std::vector<float>& b);

private:
    Embedder m_embedder;
    std::string m_model;
    std::shared_ptr<EmbeddingCache> m_cache;

    std::optional<std::vector<float>> embed(const std::string& text);
};

} // namespace casegraph::infrastructure
