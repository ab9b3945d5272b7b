/**
 * @file EmbeddingPipeline.cpp
 * @brief Implementation of EmbeddingPipeline.
 */

#include "application/EmbeddingPipeline.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <future>

namespace patentlens::application {

using domain::TextUtils;

EmbeddingPipeline::EmbeddingPipeline(std::shared_ptr<domain::EmbeddingService> service, EmbeddingSettings settings)
    : m_service(std::move(service)), m_settings(settings) {}

std::vector<float> EmbeddingPipeline::embedText(const std::string& text) const {
    std::string trimmed = TextUtils::Trim(text);
    if (trimmed.empty()) {
        return std::vector<float>(m_settings.dimensions, 0.0f);
    }

    auto vec = m_service->embed(trimmed);
    if (vec.size() != m_settings.dimensions) {
        throw domain::ProviderError(domain::ProviderErrorKind::MalformedResponse,
                                    "embedding has " + std::to_string(vec.size()) +
                                    " components, expected " + std::to_string(m_settings.dimensions));
    }
    return vec;
}

std::vector<float> EmbeddingPipeline::embedChunked(const std::string& text) const {
    auto chunks = ChunkText(text, m_settings.maxChunkChars, m_settings.chunkOverlap);
    if (chunks.size() <= 1) {
        return embedText(chunks.empty() ? text : chunks.front());
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(chunks.size());
    const size_t batch = std::max<size_t>(1, m_settings.concurrentRequests);
    for (size_t i = 0; i < chunks.size(); i += batch) {
        std::vector<std::future<std::vector<float>>> pending;
        for (size_t j = i; j < std::min(i + batch, chunks.size()); ++j) {
            pending.push_back(std::async(std::launch::async, [this, &chunks, j]() {
                return embedText(chunks[j]);
            }));
        }
        for (auto& f : pending) {
            embeddings.push_back(f.get());
        }
    }

    std::vector<float> mean(m_settings.dimensions, 0.0f);
    for (const auto& vec : embeddings) {
        for (size_t d = 0; d < mean.size(); ++d) mean[d] += vec[d];
    }
    double norm = 0.0;
    for (float& v : mean) {
        v /= static_cast<float>(embeddings.size());
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& v : mean) v = static_cast<float>(v / norm);
    }
    return mean;
}

std::vector<float> EmbeddingPipeline::embedClaim(int claimNumber, const std::string& claimText) const {
    std::string text = claimNumber > 0
        ? "Patent Claim " + std::to_string(claimNumber) + ": " + claimText
        : "Patent Claim: " + claimText;

    if (text.size() > m_settings.maxChunkChars) {
        return embedChunked(text);
    }
    return embedText(text);
}

std::vector<float> EmbeddingPipeline::embedDocument(const domain::Document& document) const {
    std::string text = "Title: " + document.title + "\n\nAbstract: " + document.abstract;
    if (document.claimsText && !document.claimsText->empty()) {
        text += "\n\nClaims: " + TextUtils::Utf8Prefix(*document.claimsText, m_settings.documentClaimsChars);
    }
    return embedText(text);
}

std::vector<std::string> EmbeddingPipeline::ChunkText(const std::string& text, size_t maxChars, size_t overlap) {
    if (text.size() <= maxChars || maxChars == 0) {
        return {text};
    }

    static const char* kSeparators[] = {". ", ".\n", "; ", ";\n"};
    std::vector<std::string> chunks;
    size_t start = 0;

    while (start < text.size()) {
        size_t end = start + maxChars;
        if (end < text.size()) {
            const std::string window = text.substr(start, maxChars);
            bool atSeparator = false;
            for (const char* sep : kSeparators) {
                size_t lastSep = window.rfind(sep);
                if (lastSep != std::string::npos && lastSep > maxChars / 2) {
                    end = start + lastSep + std::char_traits<char>::length(sep);
                    atSeparator = true;
                    break;
                }
            }
            if (!atSeparator) {
                // Hard cuts must not split a multi-byte character.
                size_t boundary = TextUtils::Utf8Boundary(text, end);
                if (boundary > start) end = boundary;
            }
        } else {
            end = text.size();
        }

        std::string chunk = TextUtils::Trim(text.substr(start, end - start));
        if (!chunk.empty()) chunks.push_back(chunk);

        if (end >= text.size()) break;
        size_t next = end > overlap ? TextUtils::Utf8Boundary(text, end - overlap) : end;
        start = next > start ? next : end;
    }
    return chunks;
}

} // namespace patentlens::application
