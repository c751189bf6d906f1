/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace scoreshelf::infrastructure {

namespace fs = std::filesystem;

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

void PersistenceService::saveSnapshotAsync(const std::string& filename, std::string content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto pending = std::find_if(m_queue.begin(), m_queue.end(),
            [&](const SnapshotWrite& w) { return w.filename == filename; });
        if (pending != m_queue.end()) {
            pending->content = std::move(content);
        } else {
            m_queue.push_back(SnapshotWrite{filename, std::move(content)});
        }
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return (m_queue.empty() && !m_writing) || !m_running;
    });
}

std::optional<std::string> PersistenceService::lastWriteError(const std::string& filename) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_writeErrors.find(filename);
    if (it == m_writeErrors.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PersistenceService::workerLoop() {
    while (true) {
        SnapshotWrite task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (m_queue.empty()) {
                if (!m_running) {
                    m_idleCv.notify_all();
                    return;
                }
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop_front();
            m_writing = true;
        }

        auto error = performAtomicWrite(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (error) {
                m_writeErrors[task.filename] = *error;
            } else {
                m_writeErrors.erase(task.filename);
            }
            m_writing = false;
        }
        m_idleCv.notify_all();
    }
}

std::optional<std::string> PersistenceService::performAtomicWrite(const SnapshotWrite& task) {
    fs::path finalPath = task.filename;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    auto fail = [&](const std::string& message) {
        std::cerr << "[PersistenceService] " << message << std::endl;
        return std::optional<std::string>(message);
    };

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            return fail("Error creating directories for " + finalPath.string() + ": " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return fail("Failed to open temp file: " + tempPath.string());
        }
        ofs.write(task.content.data(), static_cast<std::streamsize>(task.content.size()));
        ofs.flush();
        if (ofs.fail()) {
            fs::remove(tempPath, ec);
            return fail("Write failed during output: " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::string message = "Rename failed for " + finalPath.string() + ": " + ec.message();
        fs::remove(tempPath, ec);
        return fail(message);
    }
    return std::nullopt;
}

} // namespace scoreshelf::infrastructure
