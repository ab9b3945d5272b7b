/**
 * @file CorpusFile.hpp
 * @brief Reading patent documents from JSON corpus files.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Patent.hpp"

namespace patentlens::infrastructure {

class CorpusFile {
public:
    /**
     * @brief Reads a JSON array of documents, or an object holding one under "patents".
     * @throws std::runtime_error when the file cannot be opened or parsed.
     */
    static std::vector<domain::Document> Load(const std::string& path);
};

} // namespace patentlens::infrastructure
