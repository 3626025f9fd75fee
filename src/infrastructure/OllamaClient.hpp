/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace casegraph::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false) const;

    /**
     * @brief Sends a POST request to /api/embeddings.
     * @return Empty vector on any failure.
     */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text) const;

private:
    std::string m_host;
    int m_port;
};

} // namespace casegraph::infrastructure
