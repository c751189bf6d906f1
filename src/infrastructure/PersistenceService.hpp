/**
 * @file PersistenceService.hpp
 * @brief Background writer for atomic file snapshots.
 */

#pragma once
#include <string>
#include <deque>
#include <map>
#include <optional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace scoreshelf::infrastructure {

/**
 * @struct SnapshotWrite
 * @brief Full replacement content for one file.
 */
struct SnapshotWrite {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Single worker thread performing atomic (temp -> rename) writes.
 *
 * A newer snapshot queued for a file replaces an older one still waiting, so
 * only the latest state of each file reaches the disk.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues the full content of a file.
     * @param filename Target path.
     * @param content Bytes to write.
     */
    void saveSnapshotAsync(const std::string& filename, std::string content);

    /** @brief Blocks until every queued snapshot has been written. */
    void flush();

    /**
     * @brief Outcome of the most recent completed write to a file.
     * @return The failure message, or nullopt if it succeeded or none ran.
     */
    std::optional<std::string> lastWriteError(const std::string& filename);

    /** @brief Drains the queue and stops the worker. */
    void stop();

private:
    void workerLoop();

    /**
     * @brief On failure the previous file stays in place.
     * @return The failure message, or nullopt on success.
     */
    std::optional<std::string> performAtomicWrite(const SnapshotWrite& task);

    std::deque<SnapshotWrite> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_writing = false;
    std::map<std::string, std::string> m_writeErrors;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace scoreshelf::infrastructure
