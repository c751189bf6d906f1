/**
 * @file SongTable.cpp
 * @brief Implementation of SongTable.
 */

#include "infrastructure/SongTable.hpp"
#include "domain/transport/TransportErrors.hpp"
#include <algorithm>

namespace scoreshelf::infrastructure {

long long SongTable::upsert(const domain::SongRecord& record) {
    auto existing = std::find_if(m_rows.begin(), m_rows.end(),
        [&](const auto& row) { return row.second.fileName == record.fileName; });
    const long long targetId = existing != m_rows.end() ? existing->first : m_nextId;

    for (const auto& [id, row] : m_rows) {
        if (id != targetId && row.sameMetadataAs(record)) {
            throw domain::transport::DuplicateSongError(
                "A song with the same Title/Composer/Level already exists.");
        }
    }

    m_rows[targetId] = record;
    if (targetId == m_nextId) {
        ++m_nextId;
    }
    return targetId;
}

std::optional<domain::SongRecord> SongTable::find(long long songId) const {
    auto it = m_rows.find(songId);
    if (it == m_rows.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SongTable::replaceMxl(long long songId, const std::string& canonicalHex, const std::string& updatedAt) {
    auto it = m_rows.find(songId);
    if (it == m_rows.end()) {
        return false;
    }
    it->second.songMxl = canonicalHex;
    it->second.updatedAt = updatedAt;
    return true;
}

void SongTable::restore(long long songId, domain::SongRecord record) {
    m_rows[songId] = std::move(record);
    m_nextId = std::max(m_nextId, songId + 1);
}

void SongTable::reserveIdsBelow(long long nextId) {
    m_nextId = std::max(m_nextId, nextId);
}

} // namespace scoreshelf::infrastructure
