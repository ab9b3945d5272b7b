/**
 * @file OllamaClient.cpp
 * @brief Implementation of OllamaClient.
 */

#include "infrastructure/OllamaClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>

namespace patentlens::infrastructure {

using json = nlohmann::json;
using domain::ProviderError;
using domain::ProviderErrorKind;

namespace {
constexpr double kAnalysisTemperature = 0.3;
constexpr int kAnalysisMaxTokens = 1000;

ProviderErrorKind KindOf(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return ProviderErrorKind::Timeout;
        default:
            return ProviderErrorKind::Unavailable;
    }
}
}

OllamaClient::OllamaClient(OllamaSettings settings)
    : m_settings(std::move(settings)) {}

json OllamaClient::post(const std::string& path, const json& payload, int timeoutSeconds) const {
    httplib::Client cli(m_settings.host, m_settings.port);
    cli.set_connection_timeout(timeoutSeconds);
    cli.set_read_timeout(timeoutSeconds);
    cli.set_write_timeout(timeoutSeconds);

    std::string body;
    try {
        body = payload.dump();
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Could not encode request for " << path << ": " << e.what() << std::endl;
        throw ProviderError(ProviderErrorKind::MalformedResponse, path + " request is not valid UTF-8");
    }

    auto res = cli.Post(path, body, "application/json");
    if (!res) {
        auto error = res.error();
        std::cerr << "[OllamaClient] Connection failed on " << path << ": " << httplib::to_string(error) << std::endl;
        throw ProviderError(KindOf(error), path + ": " + httplib::to_string(error));
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << " on " << path << ": " << res->body << std::endl;
        throw ProviderError(res->status == 408 || res->status == 504 ? ProviderErrorKind::Timeout : ProviderErrorKind::Unavailable,
                            path + " answered HTTP " + std::to_string(res->status));
    }

    try {
        return json::parse(res->body);
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] JSON Parse Error on " << path << ": " << e.what() << std::endl;
        throw ProviderError(ProviderErrorKind::MalformedResponse, path + " returned invalid JSON");
    }
}

std::string OllamaClient::generate(const std::string& prompt, bool forceJson) const {
    json requestData = {
        {"model", m_settings.llmModel},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", kAnalysisTemperature},
            {"num_predict", kAnalysisMaxTokens}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto body = post("/api/generate", requestData, m_settings.llmTimeoutSeconds);
    if (!body.contains("response") || !body["response"].is_string()) {
        throw ProviderError(ProviderErrorKind::MalformedResponse, "/api/generate answer has no response text");
    }
    return body["response"].get<std::string>();
}

std::vector<float> OllamaClient::getEmbedding(const std::string& text) const {
    json requestData = {
        {"model", m_settings.embedModel},
        {"prompt", text}
    };

    auto body = post("/api/embeddings", requestData, m_settings.embedTimeoutSeconds);
    if (!body.contains("embedding") || !body["embedding"].is_array()) {
        throw ProviderError(ProviderErrorKind::MalformedResponse, "/api/embeddings answer has no embedding");
    }
    try {
        return body["embedding"].get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw ProviderError(ProviderErrorKind::MalformedResponse, std::string("embedding is not numeric: ") + e.what());
    }
}

} // namespace patentlens::infrastructure
