/**
 * @file QueryHistoryLog.cpp
 * @brief Append-only JSONL log of answered searches.
 */

#include "infrastructure/QueryHistoryLog.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace patentlens::infrastructure {

QueryHistoryLog::QueryHistoryLog(std::shared_ptr<PersistenceService> persistence, std::string filePath)
    : m_persistence(std::move(persistence)), m_filePath(std::move(filePath)) {}

void QueryHistoryLog::append(const domain::QueryRecord& record) {
    m_persistence->appendLineAsync(m_filePath, JsonMapping::ToJson(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace patentlens::infrastructure
