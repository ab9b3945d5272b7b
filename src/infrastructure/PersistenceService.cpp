/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace patentlens::infrastructure {

namespace fs = std::filesystem;

namespace {

bool EnsureParentDirectory(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path() && !fs::exists(path.parent_path(), ec)) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    enqueue(WriteTask{filename, content, WriteTask::Mode::Replace});
}

void PersistenceService::appendLineAsync(const std::string& filename, const std::string& line) {
    enqueue(WriteTask{filename, line, WriteTask::Mode::Append});
}

void PersistenceService::enqueue(WriteTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Dropped write to " << task.filename << " after stop" << std::endl;
            ++m_failed;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && m_inFlight == 0; });
}

void PersistenceService::workerLoop() {
    while (true) {
        WriteTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return;
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            ++m_inFlight;
        }

        // Process outside lock
        bool ok = task.mode == WriteTask::Mode::Append ? performAppend(task) : performAtomicWrite(task);
        if (!ok) ++m_failed;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::performAtomicWrite(const WriteTask& task) {
    fs::path finalPath = task.filename;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (!EnsureParentDirectory(finalPath)) return false;

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool PersistenceService::performAppend(const WriteTask& task) {
    fs::path path = task.filename;
    if (!EnsureParentDirectory(path)) return false;

    std::ofstream ofs(path, std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "[PersistenceService] Failed to open for append: " << path << std::endl;
        return false;
    }
    ofs << task.content << '\n';
    ofs.flush();
    if (ofs.fail()) {
        std::cerr << "[PersistenceService] Append failed: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace patentlens::infrastructure
