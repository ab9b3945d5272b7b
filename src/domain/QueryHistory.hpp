/**
 * @file QueryHistory.hpp
 * @brief Audit trail of search queries.
 */

#pragma once
#include <optional>
#include <string>

namespace patentlens::domain {

struct QueryRecord {
    std::string queryText;
    std::string queryType = "hybrid";
    size_t resultsCount = 0;
    std::optional<double> topScore;
    double latencyMs = 0.0;
    std::string createdAt;
};

/**
 * @class QueryHistorySink
 * @brief Fire-and-forget destination for query records.
 */
class QueryHistorySink {
public:
    virtual ~QueryHistorySink() = default;

    /** @brief Queues a record. Must not block on I/O. */
    virtual void append(const QueryRecord& record) = 0;
};

} // namespace patentlens::domain
