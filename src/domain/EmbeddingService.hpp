/**
 * @file EmbeddingService.hpp
 * @brief Interface for the semantic embedding provider.
 */

#pragma once
#include <string>
#include <vector>

namespace patentlens::domain {

/**
 * @class EmbeddingService
 * @brief Maps text to a fixed-dimension vector.
 *
 * Implementations must be pure with respect to the text content so results
 * can be cached by text. Failures are reported as domain::ProviderError.
 */
class EmbeddingService {
public:
    virtual ~EmbeddingService() = default;

    /**
     * @brief Generates an embedding for the given text.
     * @throws ProviderError (Unavailable, Timeout or MalformedResponse).
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /** @brief Dimension D of every vector returned by embed(). */
    virtual size_t dimensions() const = 0;
};

} // namespace patentlens::domain
