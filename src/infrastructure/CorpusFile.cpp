/**
 * @file CorpusFile.cpp
 * @brief Loading and saving the patent corpus as JSON.
 */

#include "infrastructure/CorpusFile.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <fstream>
#include <stdexcept>

namespace patentlens::infrastructure {

using json = nlohmann::json;

std::vector<domain::Document> CorpusFile::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("cannot open corpus file " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("corpus file " + path + " is not valid JSON: " + e.what());
    }

    const json& items = (j.is_object() && j.contains("patents")) ? j["patents"] : j;
    if (!items.is_array()) {
        throw std::runtime_error("corpus file " + path + " must hold an array of documents");
    }

    std::vector<domain::Document> documents;
    documents.reserve(items.size());
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        documents.push_back(JsonMapping::DocumentFromJson(item));
    }
    return documents;
}

} // namespace patentlens::infrastructure
