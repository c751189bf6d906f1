/**
 * @file SongRepository.hpp
 * @brief Interface for the storage collaborator holding score archives.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Song.hpp"

namespace scoreshelf::domain {

/**
 * @class SongRepository
 * @brief Abstract storage handle injected into the catalog service.
 */
class SongRepository {
public:
    virtual ~SongRepository() = default;

    /**
     * @brief Inserts or updates the row keyed on fileName.
     * @return Id of the inserted or updated row.
     * @throws transport::DuplicateSongError another file name already uses
     *         the same title/composer/level triple.
     * @throws transport::StorageError on storage failure.
     */
    virtual long long upsertSong(const SongRecord& record) = 0;

    /**
     * @brief Replaces only the archive column of an existing row.
     * @param canonicalHex "\x" hex text produced by the ingest pipeline.
     * @return False when no row has this id.
     * @throws transport::StorageError on storage failure.
     */
    virtual bool replaceSongMxl(long long songId, const std::string& canonicalHex, const std::string& updatedAt) = 0;

    /**
     * @brief Reads the archive column and title for one song.
     * @return nullopt when no row has this id.
     */
    virtual std::optional<StoredSongArtifact> findSongArtifact(long long songId) = 0;
};

} // namespace scoreshelf::domain
