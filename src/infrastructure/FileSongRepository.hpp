/**
 * @file FileSongRepository.hpp
 * @brief SongRepository persisted as a single JSON document on disk.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/SongRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SongTable.hpp"

namespace scoreshelf::infrastructure {

/**
 * @class FileSongRepository
 * @brief Keeps rows in memory and snapshots the whole table after each write.
 *
 * upsertSong() returns only once its snapshot is on disk; a failed write is
 * rolled back in memory and raised as StorageError.
 *
 * Layout: {"next_id": N, "songs": [{"song_id": .., "song_mxl": "\\x..", ...}]}
 */
class FileSongRepository : public domain::SongRepository {
public:
    /**
     * @param storePath JSON document; created on first write if absent.
     * @param persistence Shared background writer.
     * @throws transport::StorageError the existing document cannot be parsed.
     */
    FileSongRepository(std::string storePath, std::shared_ptr<PersistenceService> persistence);

    long long upsertSong(const domain::SongRecord& record) override;
    bool replaceSongMxl(long long songId, const std::string& canonicalHex, const std::string& updatedAt) override;
    std::optional<domain::StoredSongArtifact> findSongArtifact(long long songId) override;

    /** @brief Waits until the latest snapshot is on disk. */
    void flush();

    std::size_t size();

private:
    void load();

    /** @brief Snapshots the table; on failure restores previous and throws. */
    void persistLocked(SongTable previous);
    std::string serializeLocked() const;

    std::string m_storePath;
    std::shared_ptr<PersistenceService> m_persistence;
    SongTable m_table;
    std::mutex m_mutex;
};

} // namespace scoreshelf::infrastructure
