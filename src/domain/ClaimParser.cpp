/**
 * @file ClaimParser.cpp
 * @brief Implementation of the claim extraction strategies.
 */

#include "domain/ClaimParser.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace patentlens::domain {

namespace {

    bool IsSpace(char c) { return TextUtils::IsSpace(c); }
    std::string Trim(const std::string& s) { return TextUtils::Trim(s); }
    std::string ToLower(const std::string& s) { return TextUtils::ToLower(s); }

    std::optional<int> ParseClaimNumber(const std::string& digits) {
        try {
            int value = std::stoi(digits);
            if (value > 0) return value;
        } catch (const std::exception&) {
            // Out of range numbers are not claim markers.
        }
        return std::nullopt;
    }

    // Text of each claim runs from the end of its marker to the first
    // terminator found after it, or to the end of input.
    std::vector<ClaimParser::Candidate> ExtractBetweenMarkers(const std::string& text,
                                                              const std::regex& marker,
                                                              const std::regex& terminator) {
        std::vector<ClaimParser::Candidate> candidates;
        auto begin = std::sregex_iterator(text.begin(), text.end(), marker);
        auto end = std::sregex_iterator();

        for (auto it = begin; it != end; ++it) {
            const std::smatch& m = *it;
            auto number = ParseClaimNumber(m[1].str());
            if (!number) continue;

            size_t textStart = static_cast<size_t>(m.position(0) + m.length(0));
            size_t textEnd = text.size();
            std::smatch next;
            if (textStart < text.size() &&
                std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(textStart) + 1, text.end(), next, terminator)) {
                textEnd = textStart + 1 + static_cast<size_t>(next.position(0));
            }
            candidates.push_back({*number, text.substr(textStart, textEnd - textStart)});
        }
        return candidates;
    }

    Claim BuildClaim(int number, const std::string& text) {
        Claim claim;
        claim.number = number;
        claim.text = text;
        auto [independent, parent] = ClaimParser::AnalyzeDependency(text);
        claim.isIndependent = independent;
        claim.parentNumber = parent;
        claim.type = ClaimParser::DetectClaimType(text);
        return claim;
    }

    // Leading "a", "an" or "the" followed by whitespace.
    std::string StripLeadingArticle(const std::string& phrase) {
        static const std::regex article(R"(^(?:a|an|the)\s+)", std::regex::icase);
        return std::regex_replace(phrase, article, "", std::regex_constants::format_first_only);
    }

    // First run of up to four words.
    std::string LeadingNounPhrase(const std::string& phrase) {
        std::string out;
        int words = 0;
        size_t i = 0;
        while (i < phrase.size() && words < 4) {
            while (i < phrase.size() && !(std::isalnum(static_cast<unsigned char>(phrase[i])) || phrase[i] == '_')) {
                if (!out.empty() && !IsSpace(phrase[i])) return out;
                ++i;
            }
            size_t start = i;
            while (i < phrase.size() && (std::isalnum(static_cast<unsigned char>(phrase[i])) || phrase[i] == '_')) ++i;
            if (i == start) break;
            if (!out.empty()) out += ' ';
            out += phrase.substr(start, i - start);
            ++words;
        }
        return out;
    }

    std::vector<std::string> SplitComponents(const std::string& components) {
        static const std::regex delimiter(R"([;,](?:\s*and)?|\s+and\s+)", std::regex::icase);
        std::vector<std::string> parts;
        std::sregex_token_iterator it(components.begin(), components.end(), delimiter, -1);
        std::sregex_token_iterator end;
        for (; it != end; ++it) {
            parts.push_back(it->str());
        }
        return parts;
    }

} // namespace

std::string ClaimParser::Normalize(const std::string& rawText) {
    static const std::regex blanks(R"([ \t]+)");
    static const std::regex pageNumberLine(R"(\n\s*-?\d+-?\s*\n)");

    std::string text;
    text.reserve(rawText.size());
    for (size_t i = 0; i < rawText.size(); ++i) {
        if (rawText[i] == '\r' && i + 1 < rawText.size() && rawText[i + 1] == '\n') continue;
        text.push_back(rawText[i]);
    }
    text = std::regex_replace(text, blanks, " ");
    text = std::regex_replace(text, pageNumberLine, "\n");
    return Trim(text);
}

std::string ClaimParser::CleanClaimText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (IsSpace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }
    return out;
}

std::vector<ClaimParser::Candidate> ClaimParser::NumberedLineStrategy(const std::string& normalized) {
    static const std::regex marker(R"((?:^|\n)\s*(\d+)[.)])");
    static const std::regex terminator(R"(\n\s*\d+[.)])");
    return ExtractBetweenMarkers(normalized, marker, terminator);
}

std::vector<ClaimParser::Candidate> ClaimParser::ClaimLabelStrategy(const std::string& normalized) {
    static const std::regex marker(R"((?:^|\n)\s*[Cc]laim\s+(\d+)[.:])");
    static const std::regex terminator(R"(\n\s*[Cc]laim\s+\d+)");
    return ExtractBetweenMarkers(normalized, marker, terminator);
}

std::vector<ClaimParser::Candidate> ClaimParser::LineScanFallback(const std::string& normalized) {
    std::vector<Candidate> candidates;
    std::istringstream ss(normalized);
    std::string line;
    std::optional<int> currentNumber;
    std::vector<std::string> currentLines;

    auto flush = [&]() {
        if (currentNumber && !currentLines.empty()) {
            std::string joined;
            for (const auto& part : currentLines) {
                if (!joined.empty()) joined += ' ';
                joined += part;
            }
            candidates.push_back({*currentNumber, joined});
        }
    };

    while (std::getline(ss, line)) {
        line = Trim(line);
        if (line.empty()) continue;

        size_t digitsEnd = 0;
        while (digitsEnd < line.size() && std::isdigit(static_cast<unsigned char>(line[digitsEnd]))) ++digitsEnd;
        bool startsClaim = digitsEnd > 0 && digitsEnd < line.size() &&
                           (line[digitsEnd] == '.' || line[digitsEnd] == ')');
        std::optional<int> number = startsClaim ? ParseClaimNumber(line.substr(0, digitsEnd)) : std::nullopt;

        if (number) {
            flush();
            currentNumber = number;
            currentLines.clear();
            std::string rest = Trim(line.substr(digitsEnd + 1));
            if (!rest.empty()) currentLines.push_back(rest);
        } else if (currentNumber) {
            currentLines.push_back(line);
        }
    }
    flush();
    return candidates;
}

const std::vector<ClaimParser::Strategy>& ClaimParser::Strategies() {
    static const std::vector<Strategy> strategies = {
        &ClaimParser::NumberedLineStrategy,
        &ClaimParser::ClaimLabelStrategy
    };
    return strategies;
}

std::vector<Claim> ClaimParser::Parse(const std::string& rawText) {
    std::vector<Claim> claims;
    if (Trim(rawText).empty()) return claims;

    try {
        const std::string normalized = Normalize(rawText);

        for (const auto& strategy : Strategies()) {
            auto candidates = strategy(normalized);
            if (candidates.empty()) continue;

            for (const auto& candidate : candidates) {
                std::string text = CleanClaimText(candidate.text);
                if (text.size() < kMinClaimLength) continue;
                claims.push_back(BuildClaim(candidate.number, text));
            }
            break;
        }

        if (claims.empty()) {
            for (const auto& candidate : LineScanFallback(normalized)) {
                std::string text = CleanClaimText(candidate.text);
                if (text.empty()) continue;
                claims.push_back(BuildClaim(candidate.number, text));
            }
        }
    } catch (const std::regex_error& e) {
        std::cerr << "[ClaimParser] Pattern evaluation failed, returning partial result: " << e.what() << std::endl;
    }

    std::stable_sort(claims.begin(), claims.end(), [](const Claim& a, const Claim& b) {
        return a.number < b.number;
    });
    return claims;
}

std::pair<bool, std::optional<int>> ClaimParser::AnalyzeDependency(const std::string& claimText) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"((?:according to|as (?:claimed|defined|set forth|recited) in|of) claims?\s+(\d+))", std::regex::icase),
        std::regex(R"(claims?\s+(\d+)[,\s]+(?:wherein|where|further|additionally))", std::regex::icase),
        std::regex(R"((?:The|A|An)\s+\w+\s+(?:of|according to)\s+claim\s+(\d+))", std::regex::icase)
    };

    for (const auto& pattern : patterns) {
        std::smatch m;
        if (std::regex_search(claimText, m, pattern)) {
            if (auto parent = ParseClaimNumber(m[1].str())) {
                return {false, parent};
            }
        }
    }
    return {true, std::nullopt};
}

std::optional<ClaimType> ClaimParser::DetectClaimType(const std::string& claimText) {
    static const std::vector<std::pair<ClaimType, std::regex>> rules = {
        {ClaimType::Method, std::regex(R"((?:A|The)\s+method)", std::regex::icase)},
        {ClaimType::Apparatus, std::regex(R"((?:A|An|The)\s+(?:apparatus|device|machine|equipment))", std::regex::icase)},
        {ClaimType::System, std::regex(R"((?:A|The)\s+system)", std::regex::icase)},
        {ClaimType::Composition, std::regex(R"((?:A|The)\s+(?:composition|compound|formulation|mixture))", std::regex::icase)},
        {ClaimType::Article, std::regex(R"((?:A|An|The)\s+(?:article|product|manufacture))", std::regex::icase)},
        {ClaimType::Process, std::regex(R"((?:A|The)\s+process)", std::regex::icase)}
    };

    for (const auto& [type, pattern] : rules) {
        if (std::regex_search(claimText, pattern, std::regex_constants::match_continuous)) {
            return type;
        }
    }
    return std::nullopt;
}

std::vector<std::string> ClaimParser::ExtractKeyElements(const std::string& claimText) {
    std::vector<std::string> elements;
    std::unordered_set<std::string> seen;

    auto add = [&](const std::string& element) {
        if (elements.size() >= kMaxKeyElements) return;
        if (seen.insert(element).second) elements.push_back(element);
    };

    // Quoted terms, verbatim.
    size_t pos = 0;
    while (pos < claimText.size()) {
        size_t open = claimText.find('"', pos);
        if (open == std::string::npos) break;
        size_t close = claimText.find('"', open + 1);
        if (close == std::string::npos) break;
        if (close > open + 1) add(claimText.substr(open + 1, close - open - 1));
        pos = close + 1;
    }

    static const std::regex transition(R"((?:comprising|including|having|consists? of)[:\s]+)", std::regex::icase);
    std::smatch m;
    try {
        if (!std::regex_search(claimText, m, transition)) return elements;
    } catch (const std::regex_error& e) {
        std::cerr << "[ClaimParser] Key element scan failed: " << e.what() << std::endl;
        return elements;
    }

    size_t start = static_cast<size_t>(m.position(0) + m.length(0));
    if (start >= claimText.size()) return elements;

    // Components run until "where"/"wherein", a semicolon or the end.
    const std::string lowered = ToLower(claimText);
    size_t stop = claimText.size();
    size_t whereAt = lowered.find("where", start + 1);
    size_t semicolonAt = lowered.find(';', start + 1);
    if (whereAt != std::string::npos) stop = std::min(stop, whereAt);
    if (semicolonAt != std::string::npos) stop = std::min(stop, semicolonAt);

    for (const auto& rawPart : SplitComponents(claimText.substr(start, stop - start))) {
        std::string phrase = LeadingNounPhrase(StripLeadingArticle(Trim(rawPart)));
        if (phrase.size() < 4) continue;
        add(phrase);
    }
    return elements;
}

} // namespace patentlens::domain
