/**
 * @file QueryHistoryLog.hpp
 * @brief JSON-lines query history written through the PersistenceService.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/QueryHistory.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace patentlens::infrastructure {

class QueryHistoryLog : public domain::QueryHistorySink {
public:
    QueryHistoryLog(std::shared_ptr<PersistenceService> persistence, std::string filePath);

    /** @brief Queues one JSON line; never touches the disk on the caller's thread. */
    void append(const domain::QueryRecord& record) override;

    const std::string& filePath() const { return m_filePath; }

private:
    std::shared_ptr<PersistenceService> m_persistence;
    std::string m_filePath;
};

} // namespace patentlens::infrastructure
