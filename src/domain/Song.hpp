/**
 * @file Song.hpp
 * @brief Catalog entities exchanged with the storage collaborator.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace scoreshelf::domain {

/**
 * @struct SongUpload
 * @brief Client upload envelope. Every field is a required non-empty string.
 */
struct SongUpload {
    std::string songTitle;
    std::string composerFirstName;
    std::string composerLastName;
    std::string skillLevelName;
    std::string fileName;      ///< Upsert key.
    std::string songMxlBase64; ///< Archive bytes as sent by the client.
};

/**
 * @struct SongRecord
 * @brief Row written to storage.
 */
struct SongRecord {
    std::string songTitle;
    std::string composerFirstName;
    std::string composerLastName;
    std::string skillLevelName;
    std::string fileName;
    std::string songMxl;   ///< Canonical "\x" hex text.
    std::string updatedAt; ///< ISO-8601 UTC.

    /** @brief True when both rows share the title/composer/level triple. */
    bool sameMetadataAs(const SongRecord& other) const {
        return songTitle == other.songTitle &&
               composerFirstName == other.composerFirstName &&
               composerLastName == other.composerLastName &&
               skillLevelName == other.skillLevelName;
    }
};

/**
 * @struct StoredSongArtifact
 * @brief What a storage read returns for one song's archive.
 *
 * songMxl has no declared encoding: hex text, base64 text, a binary value,
 * an array of byte integers, or null.
 */
struct StoredSongArtifact {
    nlohmann::json songMxl;
    std::optional<std::string> songTitle;
};

} // namespace scoreshelf::domain
