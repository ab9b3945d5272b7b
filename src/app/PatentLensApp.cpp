/**
 * @file PatentLensApp.cpp
 * @brief Implementation of the PatentLensApp class.
 */

#include "app/PatentLensApp.hpp"
#include "domain/ClaimParser.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CachedEmbeddingService.hpp"
#include "infrastructure/CorpusFile.hpp"
#include "infrastructure/JsonMapping.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/QueryHistoryLog.hpp"
#include "infrastructure/RapidFuzzTextScorer.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

namespace patentlens::app {

using json = nlohmann::json;
using infrastructure::JsonMapping;

namespace {

size_t ParseSize(const std::string& value, const char* name) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < 0) throw std::invalid_argument(value);
        return static_cast<size_t>(parsed);
    } catch (const std::logic_error&) {
        throw domain::InvalidInputError(std::string(name) + " must be a non-negative integer: " + value);
    }
}

double ParseDouble(const std::string& value, const char* name) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw domain::InvalidInputError(std::string(name) + " must be a number: " + value);
    }
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw domain::InvalidInputError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void RequireArgs(const std::vector<std::string>& args, size_t count) {
    if (args.size() < count) {
        throw domain::InvalidInputError("missing arguments for '" + args.front() + "'\n" + PatentLensApp::Usage());
    }
}

} // namespace

std::string PatentLensApp::Usage() {
    return "usage: patentlens [--config settings.json] [--no-analysis] <command>\n"
           "  import <corpus.json>\n"
           "  parse <claims.txt>\n"
           "  elements <claim text>\n"
           "  search <query> [limit] [vector_weight]\n"
           "  compare <sourceId> <targetId>\n"
           "  analyze <sourceId> <targetId>\n"
           "  prior-art <invention text> [limit]\n"
           "  quick-check <invention text>\n"
           "  similar-claims <claim text> [limit] [excludeId]\n"
           "  invention-vs <documentId> <invention text>\n";
}

int PatentLensApp::Run(int argc, char** argv) {
    std::string configPath = infrastructure::PathUtils::GetSettingsPath().string();
    bool includeAnalysis = true;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--no-analysis") {
            includeAnalysis = false;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << Usage();
            return kSuccess;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        std::cerr << Usage();
        return kInvalidInput;
    }

    int code = kSuccess;
    try {
        Init(configPath);
        json result = Dispatch(args, includeAnalysis);
        std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    } catch (const domain::InvalidInputError& e) {
        std::cerr << "[PatentLens] INVALID_INPUT: " << e.what() << std::endl;
        code = kInvalidInput;
    } catch (const domain::ProviderError& e) {
        std::cerr << "[PatentLens] " << e.what() << (e.isRetryable() ? " (retryable)" : "") << std::endl;
        code = e.isRetryable() ? kRetryableFailure : kFailure;
    } catch (const std::exception& e) {
        std::cerr << "[PatentLens] Error: " << e.what() << std::endl;
        code = kFailure;
    }

    Shutdown();
    return code;
}

void PatentLensApp::Init(const std::string& configPath) {
    m_settings = infrastructure::ConfigLoader::Load(configPath);
    const auto& analysis = m_settings.analysis;
    const std::int64_t longTtl = m_settings.cache.ttlSeconds * m_settings.cache.longLivedFactor;

    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.cache = std::make_shared<infrastructure::ResultCache>(m_settings.paths.cache, m_settings.cache.ttlSeconds);
    m_services.cache->load();

    m_services.repository = std::make_shared<infrastructure::InMemoryPatentRepository>();
    if (!m_services.repository->loadFile(m_settings.paths.corpus)) {
        std::clog << "[PatentLens] No stored corpus at " << m_settings.paths.corpus << ", starting empty" << std::endl;
    }

    auto client = std::make_shared<infrastructure::OllamaClient>(m_settings.ollama);
    auto ollamaEmbeddings = std::make_shared<infrastructure::OllamaEmbeddingAdapter>(client, analysis.embedding.dimensions);
    auto cachedEmbeddings = std::make_shared<infrastructure::CachedEmbeddingService>(ollamaEmbeddings, m_services.cache, longTtl);
    auto narrative = std::make_shared<infrastructure::OllamaNarrativeAdapter>(client);
    auto scorer = std::make_shared<infrastructure::RapidFuzzTextScorer>();
    auto history = std::make_shared<infrastructure::QueryHistoryLog>(m_services.persistenceService, m_settings.paths.history);

    m_services.embeddings = std::make_shared<application::EmbeddingPipeline>(cachedEmbeddings, analysis.embedding);
    m_services.claimIndexing = std::make_shared<application::ClaimIndexingService>(
        m_services.repository, m_services.embeddings, analysis.embedding.concurrentRequests);
    m_services.ingestionService = std::make_unique<application::PatentIngestionService>(
        m_services.repository, m_services.embeddings, m_services.claimIndexing);
    m_services.claimComparisonService = std::make_unique<application::ClaimComparisonService>(
        m_services.repository, m_services.claimIndexing, m_services.embeddings, narrative,
        analysis.claims, analysis.priorArt.thresholds);
    m_services.searchService = std::make_unique<application::HybridSearchService>(
        m_services.repository, m_services.embeddings, scorer, history, analysis.search);
    m_services.priorArtService = std::make_unique<application::PriorArtService>(
        m_services.repository, m_services.embeddings, narrative, analysis.priorArt);
    m_services.infringementService = std::make_unique<application::InfringementAnalysisService>(
        m_services.repository, scorer, narrative, m_services.cache, analysis.search.defaultVectorWeight);
}

void PatentLensApp::Shutdown() {
    if (!m_services.persistenceService) return;

    if (m_corpusChanged && m_services.repository) {
        m_services.persistenceService->saveTextAsync(m_settings.paths.corpus, m_services.repository->toJson().dump(-1, ' ', false, json::error_handler_t::replace));
    }
    if (m_services.cache) {
        m_services.cache->purgeExpired();
        m_services.cache->persist(*m_services.persistenceService);
    }
    m_services.persistenceService->stop();

    if (m_services.persistenceService->failedWrites() > 0) {
        std::cerr << "[PatentLens] " << m_services.persistenceService->failedWrites() << " writes failed" << std::endl;
    }
}

json PatentLensApp::Dispatch(const std::vector<std::string>& args, bool includeAnalysis) {
    const std::string& command = args.front();
    if (command == "import") {
        RequireArgs(args, 2);
        return CmdImport(args[1]);
    }
    if (command == "parse") {
        RequireArgs(args, 2);
        return CmdParse(args[1]);
    }
    if (command == "elements") {
        RequireArgs(args, 2);
        return CmdElements(args[1]);
    }
    if (command == "search") {
        RequireArgs(args, 2);
        return CmdSearch(args);
    }
    if (command == "compare") {
        RequireArgs(args, 3);
        return CmdCompare(args[1], args[2], includeAnalysis);
    }
    if (command == "analyze") {
        RequireArgs(args, 3);
        return CmdAnalyze(args[1], args[2]);
    }
    if (command == "prior-art") {
        RequireArgs(args, 2);
        return CmdPriorArt(args, includeAnalysis);
    }
    if (command == "quick-check") {
        RequireArgs(args, 2);
        return CmdQuickCheck(args[1]);
    }
    if (command == "similar-claims") {
        RequireArgs(args, 2);
        return CmdSimilarClaims(args);
    }
    if (command == "invention-vs") {
        RequireArgs(args, 3);
        return CmdInventionVs(args[1], args[2]);
    }
    throw domain::InvalidInputError("unknown command '" + command + "'\n" + Usage());
}

json PatentLensApp::CmdImport(const std::string& path) {
    std::vector<domain::Document> documents;
    try {
        documents = infrastructure::CorpusFile::Load(path);
    } catch (const std::runtime_error& e) {
        throw domain::InvalidInputError(e.what());
    }

    auto result = m_services.ingestionService->ingestAll(documents, [](const std::string& status) {
        std::clog << "[Import] " << status << std::endl;
    });
    m_corpusChanged = result.documentsStored > 0;

    return {
        {"total", result.documentsReceived},
        {"imported", result.documentsStored},
        {"failed", result.documentsReceived - result.documentsStored},
        {"claims_indexed", result.claimsIndexed},
        {"errors", result.errors}
    };
}

json PatentLensApp::CmdParse(const std::string& path) {
    auto claims = domain::ClaimParser::Parse(ReadFile(path));
    json out = json::array();
    for (auto& claim : claims) {
        claim.keyElements = domain::ClaimParser::ExtractKeyElements(claim.text);
        out.push_back(JsonMapping::ToJson(claim));
    }
    return { {"claims_count", claims.size()}, {"claims", out} };
}

json PatentLensApp::CmdElements(const std::string& text) {
    return { {"key_elements", domain::ClaimParser::ExtractKeyElements(text)} };
}

json PatentLensApp::CmdSearch(const std::vector<std::string>& args) {
    auto& search = *m_services.searchService;
    size_t limit = args.size() > 2 ? ParseSize(args[2], "limit") : search.settings().maxResults;
    double weight = args.size() > 3 ? ParseDouble(args[3], "vector_weight") : search.settings().defaultVectorWeight;

    auto results = search.search(args[1], limit, weight);
    return { {"query", args[1]}, {"results", JsonMapping::ToJsonArray(results)} };
}

json PatentLensApp::CmdCompare(const std::string& sourceId, const std::string& targetId, bool includeAnalysis) {
    const size_t sourceBefore = m_services.repository->claimsFor(sourceId).size();
    const size_t targetBefore = m_services.repository->claimsFor(targetId).size();

    auto result = m_services.claimComparisonService->compareDocuments(sourceId, targetId, includeAnalysis);
    m_corpusChanged = m_corpusChanged || sourceBefore == 0 || targetBefore == 0;
    return JsonMapping::ToJson(result);
}

json PatentLensApp::CmdAnalyze(const std::string& sourceId, const std::string& targetId) {
    return JsonMapping::ToJson(m_services.infringementService->analyze(sourceId, targetId));
}

json PatentLensApp::CmdPriorArt(const std::vector<std::string>& args, bool includeAnalysis) {
    size_t limit = args.size() > 2 ? ParseSize(args[2], "limit") : 20;
    return JsonMapping::ToJson(m_services.priorArtService->locate(args[1], limit, includeAnalysis));
}

json PatentLensApp::CmdQuickCheck(const std::string& text) {
    json matches = json::array();
    for (const auto& hit : m_services.priorArtService->quickCheck(text)) {
        matches.push_back(JsonMapping::ToJson(hit));
    }
    return { {"top_matches", matches} };
}

json PatentLensApp::CmdSimilarClaims(const std::vector<std::string>& args) {
    size_t limit = args.size() > 2 ? ParseSize(args[2], "limit") : 10;
    std::optional<std::string> exclude;
    if (args.size() > 3) exclude = args[3];

    auto hits = m_services.claimComparisonService->findSimilarClaims(args[1], limit, exclude);
    return { {"claims", JsonMapping::ToJsonArray(hits)} };
}

json PatentLensApp::CmdInventionVs(const std::string& documentId, const std::string& text) {
    const bool hadClaims = !m_services.repository->claimsFor(documentId).empty();
    auto comparison = m_services.claimComparisonService->compareInventionToClaims(text, documentId);
    m_corpusChanged = m_corpusChanged || !hadClaims;
    return JsonMapping::ToJson(comparison);
}

} // namespace patentlens::app
