#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace casegraph::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kGenerateTimeoutSec = 600;
constexpr int kEmbeddingTimeoutSec = 180;
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  bool forceJson) const {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kGenerateTimeoutSec);

    json requestData = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("response") && body["response"].is_string()) {
                return body["response"].get<std::string>();
            }
            std::cerr << "[OllamaClient] Reply without a response field" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        }
    }
    return std::nullopt;
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) const {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(kEmbeddingTimeoutSec);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("embedding") && body["embedding"].is_array()) {
                return body["embedding"].get<std::vector<float>>();
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OllamaClient] Embedding HTTP Error " << res->status << std::endl;
    } else {
        std::cerr << "[OllamaClient] Embedding connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return {};
}

} // namespace casegraph::infrastructure
