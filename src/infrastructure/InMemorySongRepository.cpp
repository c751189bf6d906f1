/**
 * @file InMemorySongRepository.cpp
 * @brief Implementation of InMemorySongRepository.
 */

#include "infrastructure/InMemorySongRepository.hpp"
#include "domain/transport/ArtifactCodec.hpp"
#include <nlohmann/json.hpp>

namespace scoreshelf::infrastructure {

using json = nlohmann::json;
using domain::transport::ArtifactCodec;

InMemorySongRepository::InMemorySongRepository(ArtifactReadShape readShape)
    : m_readShape(readShape) {}

long long InMemorySongRepository::upsertSong(const domain::SongRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.upsert(record);
}

bool InMemorySongRepository::replaceSongMxl(long long songId, const std::string& canonicalHex,
                                            const std::string& updatedAt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.replaceMxl(songId, canonicalHex, updatedAt);
}

std::optional<domain::SongRecord> InMemorySongRepository::findRecord(long long songId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.find(songId);
}

std::optional<domain::StoredSongArtifact> InMemorySongRepository::findSongArtifact(long long songId) {
    auto record = findRecord(songId);
    if (!record) {
        return std::nullopt;
    }

    domain::StoredSongArtifact stored;
    stored.songTitle = record->songTitle;
    if (m_readShape == ArtifactReadShape::HexText) {
        stored.songMxl = record->songMxl;
        return stored;
    }

    // Stored text is canonical, so it always decodes.
    auto artifact = ArtifactCodec::decodeHex(record->songMxl);
    switch (m_readShape) {
        case ArtifactReadShape::Base64Text:
            stored.songMxl = ArtifactCodec::encodeBase64(artifact);
            break;
        case ArtifactReadShape::Binary:
            stored.songMxl = json::binary(artifact.bytes());
            break;
        case ArtifactReadShape::ByteArray:
            stored.songMxl = artifact.bytes();
            break;
        case ArtifactReadShape::HexText:
            break;
    }
    return stored;
}

} // namespace scoreshelf::infrastructure
