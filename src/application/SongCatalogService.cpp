/**
 * @file SongCatalogService.cpp
 * @brief Implementation of SongCatalogService.
 */

#include "application/SongCatalogService.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <array>
#include <nlohmann/json.hpp>
#include <vector>

namespace scoreshelf::application {

using json = nlohmann::json;
using domain::transport::RequestError;

namespace {

// Order matters: the error message lists missing keys in this order.
const std::array<const char*, 6> kRequiredKeys = {
    "song_title",
    "composer_first_name",
    "composer_last_name",
    "skill_level_name",
    "file_name",
    "song_mxl_base64",
};

bool isNonEmptyString(const json& body, const char* key) {
    auto it = body.find(key);
    return it != body.end() && it->is_string() && !it->get_ref<const std::string&>().empty();
}

} // namespace

SongCatalogService::SongCatalogService(std::shared_ptr<domain::SongRepository> repository,
                                       ArtifactIngestService ingestService,
                                       ArtifactRetrievalService retrievalService)
    : m_repository(std::move(repository)),
      m_ingestService(ingestService),
      m_retrievalService(retrievalService) {}

domain::SongUpload SongCatalogService::parseUpload(const std::string& jsonBody) {
    json body = json::parse(jsonBody, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw RequestError("Invalid JSON body");
    }

    std::string missing;
    for (const char* key : kRequiredKeys) {
        if (!isNonEmptyString(body, key)) {
            if (!missing.empty()) missing += ", ";
            missing += key;
        }
    }
    if (!missing.empty()) {
        throw RequestError("Missing or invalid: " + missing);
    }

    domain::SongUpload upload;
    upload.songTitle = body["song_title"].get<std::string>();
    upload.composerFirstName = body["composer_first_name"].get<std::string>();
    upload.composerLastName = body["composer_last_name"].get<std::string>();
    upload.skillLevelName = body["skill_level_name"].get<std::string>();
    upload.fileName = body["file_name"].get<std::string>();
    upload.songMxlBase64 = body["song_mxl_base64"].get<std::string>();
    return upload;
}

SongCatalogService::UpsertResult SongCatalogService::upsert(const domain::SongUpload& upload) {
    auto outcome = m_ingestService.ingest(upload.songMxlBase64);

    domain::SongRecord record;
    record.songTitle = upload.songTitle;
    record.composerFirstName = upload.composerFirstName;
    record.composerLastName = upload.composerLastName;
    record.skillLevelName = upload.skillLevelName;
    record.fileName = upload.fileName;
    record.songMxl = outcome.canonicalHex;
    record.updatedAt = infrastructure::TimeUtils::NowIsoUtc();

    long long songId = m_repository->upsertSong(record);
    return UpsertResult{songId, std::move(outcome)};
}

std::optional<ArtifactIngestService::IngestOutcome> SongCatalogService::replaceArtifact(
    long long songId, const domain::transport::RawArtifact& artifact) {
    auto outcome = m_ingestService.ingestBytes(artifact);
    if (!m_repository->replaceSongMxl(songId, outcome.canonicalHex, infrastructure::TimeUtils::NowIsoUtc())) {
        return std::nullopt;
    }
    return outcome;
}

std::optional<ArtifactRetrievalService::RetrievedArtifact> SongCatalogService::fetchArtifact(long long songId) {
    auto stored = m_repository->findSongArtifact(songId);
    if (!stored) {
        return std::nullopt;
    }
    return m_retrievalService.retrieve(*stored);
}

} // namespace scoreshelf::application
