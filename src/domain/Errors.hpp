/**
 * @file Errors.hpp
 * @brief Typed failures surfaced by the analysis core.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace patentlens::domain {

/**
 * @class InvalidInputError
 * @brief Caller-correctable input problem, raised before any provider call.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& message)
        : std::invalid_argument(message) {}
};

enum class ProviderErrorKind {
    Unavailable,
    Timeout,
    MalformedResponse
};

inline std::string ProviderErrorKindToString(ProviderErrorKind kind) {
    switch (kind) {
        case ProviderErrorKind::Unavailable: return "PROVIDER_UNAVAILABLE";
        case ProviderErrorKind::Timeout: return "PROVIDER_TIMEOUT";
        case ProviderErrorKind::MalformedResponse: return "MALFORMED_PROVIDER_RESPONSE";
    }
    return "PROVIDER_UNAVAILABLE";
}

/**
 * @class ProviderError
 * @brief An external capability provider failed or exceeded its time bound.
 */
class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrorKind kind, const std::string& message)
        : std::runtime_error(ProviderErrorKindToString(kind) + ": " + message), m_kind(kind) {}

    ProviderErrorKind kind() const { return m_kind; }

    /** @brief Unavailable and timed-out calls may succeed when repeated. */
    bool isRetryable() const {
        return m_kind == ProviderErrorKind::Unavailable || m_kind == ProviderErrorKind::Timeout;
    }

private:
    ProviderErrorKind m_kind;
};

} // namespace patentlens::domain
