/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized file I/O on a background thread.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace patentlens::infrastructure {

/**
 * @struct WriteTask
 * @brief Represents a single file operation.
 */
struct WriteTask {
    enum class Mode {
        Replace, ///< Atomic temp-file-then-rename.
        Append   ///< One line appended to the file.
    };

    std::string filename;
    std::string content;
    Mode mode = Mode::Replace;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs file writes sequentially.
 *
 * Every write passes through one serialized queue, so callers never block on
 * disk I/O and never interleave partial writes. Failures are logged and the
 * task is dropped.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Queues a full-file replacement.
     * @param filename Path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Queues @p line (a newline is added) for appending to @p filename. */
    void appendLineAsync(const std::string& filename, const std::string& line);

    /** @brief Blocks until every task queued so far has been processed. */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Tasks that failed since construction. */
    size_t failedWrites() const { return m_failed.load(); }

private:
    void enqueue(WriteTask task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    bool performAtomicWrite(const WriteTask& task);
    bool performAppend(const WriteTask& task);

    // Thread Safety
    std::queue<WriteTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    size_t m_inFlight = 0;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_failed{0};
};

} // namespace patentlens::infrastructure
