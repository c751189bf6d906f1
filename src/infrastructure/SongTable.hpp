/**
 * @file SongTable.hpp
 * @brief In-memory song rows with the catalog's upsert semantics.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include "domain/Song.hpp"

namespace scoreshelf::infrastructure {

/**
 * @class SongTable
 * @brief Rows keyed by id, upserted on file name.
 *
 * Not synchronized; owning repositories hold the lock.
 */
class SongTable {
public:
    /**
     * @brief Updates the row with the same file name in place, or inserts a
     *        new row with the next id.
     * @throws transport::DuplicateSongError title/composer/level already used
     *         by a row with a different file name.
     */
    long long upsert(const domain::SongRecord& record);

    std::optional<domain::SongRecord> find(long long songId) const;

    /** @return False when no row has this id. */
    bool replaceMxl(long long songId, const std::string& canonicalHex, const std::string& updatedAt);

    /** @brief Restores a persisted row, keeping its id. */
    void restore(long long songId, domain::SongRecord record);

    /** @brief Ids below nextId are never handed out again. */
    void reserveIdsBelow(long long nextId);

    const std::map<long long, domain::SongRecord>& rows() const { return m_rows; }
    long long nextId() const { return m_nextId; }

private:
    std::map<long long, domain::SongRecord> m_rows;
    long long m_nextId = 1;
};

} // namespace scoreshelf::infrastructure
