/**
 * @file InMemorySongRepository.hpp
 * @brief Process-local SongRepository, configurable in how it returns bytes.
 */

#pragma once

#include <mutex>
#include "domain/SongRepository.hpp"
#include "infrastructure/SongTable.hpp"

namespace scoreshelf::infrastructure {

/**
 * @enum ArtifactReadShape
 * @brief Representation findSongArtifact() uses for the archive column,
 *        mirroring what different storage drivers hand back.
 */
enum class ArtifactReadShape {
    HexText,   ///< As stored: "\x..." text.
    Base64Text,
    Binary,    ///< JSON binary value.
    ByteArray  ///< JSON array of integers.
};

class InMemorySongRepository : public domain::SongRepository {
public:
    explicit InMemorySongRepository(ArtifactReadShape readShape = ArtifactReadShape::HexText);

    long long upsertSong(const domain::SongRecord& record) override;
    bool replaceSongMxl(long long songId, const std::string& canonicalHex, const std::string& updatedAt) override;
    std::optional<domain::StoredSongArtifact> findSongArtifact(long long songId) override;

    /** @brief Copy of the stored row, for inspection. */
    std::optional<domain::SongRecord> findRecord(long long songId);

private:
    ArtifactReadShape m_readShape;
    SongTable m_table;
    std::mutex m_mutex;
};

} // namespace scoreshelf::infrastructure
