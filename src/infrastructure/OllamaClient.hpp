/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace patentlens::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string embedModel = "nomic-embed-text";
    std::string llmModel = "qwen2.5:7b";
    int embedTimeoutSeconds = 60;
    int llmTimeoutSeconds = 120;
};

/**
 * @class OllamaClient
 * @brief Blocking calls to /api/generate and /api/embeddings.
 *
 * Transport failures and non-200 answers raise domain::ProviderError
 * (Timeout for connect/read/write timeouts, Unavailable otherwise); a 200
 * answer that lacks the expected field raises MalformedResponse.
 */
class OllamaClient {
public:
    explicit OllamaClient(OllamaSettings settings = {});

    /** @brief Sends a POST request to /api/generate and returns "response". */
    std::string generate(const std::string& prompt, bool forceJson = false) const;

    /** @brief Sends a POST request to /api/embeddings and returns "embedding". */
    std::vector<float> getEmbedding(const std::string& text) const;

    const OllamaSettings& settings() const { return m_settings; }

private:
    nlohmann::json post(const std::string& path, const nlohmann::json& payload, int timeoutSeconds) const;

    OllamaSettings m_settings;
};

} // namespace patentlens::infrastructure
