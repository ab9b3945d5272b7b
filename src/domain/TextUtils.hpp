/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared across layers.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace patentlens::domain {

class TextUtils {
public:
    static bool IsSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    static std::string Trim(const std::string& s) {
        size_t first = 0;
        while (first < s.size() && IsSpace(s[first])) ++first;
        size_t last = s.size();
        while (last > first && IsSpace(s[last - 1])) --last;
        return s.substr(first, last - first);
    }

    static std::string ToLower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    /** @brief True for UTF-8 continuation bytes (10xxxxxx). */
    static bool IsContinuationByte(char c) {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    /**
     * @brief Largest offset <= @p pos that does not fall inside a multi-byte
     *        UTF-8 sequence.
     */
    static size_t Utf8Boundary(const std::string& s, size_t pos) {
        if (pos >= s.size()) return s.size();
        while (pos > 0 && IsContinuationByte(s[pos])) --pos;
        return pos;
    }

    /** @brief At most @p maxBytes bytes of @p s, never splitting a character. */
    static std::string Utf8Prefix(const std::string& s, size_t maxBytes) {
        if (s.size() <= maxBytes) return s;
        return s.substr(0, Utf8Boundary(s, maxBytes));
    }

    /** @brief First @p maxChars bytes (UTF-8 safe), with "..." appended when cut. */
    static std::string Ellipsize(const std::string& s, size_t maxChars) {
        if (s.size() <= maxChars) return s;
        return Utf8Prefix(s, maxChars) + "...";
    }
};

} // namespace patentlens::domain
