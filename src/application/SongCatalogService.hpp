/**
 * @file SongCatalogService.hpp
 * @brief Application service for storing and fetching song archives.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include "application/ArtifactIngestService.hpp"
#include "application/ArtifactRetrievalService.hpp"
#include "domain/Song.hpp"
#include "domain/SongRepository.hpp"

namespace scoreshelf::application {

/**
 * @class SongCatalogService
 * @brief Validates upload envelopes and connects the transport pipelines to
 *        the injected storage handle.
 */
class SongCatalogService {
public:
    SongCatalogService(std::shared_ptr<domain::SongRepository> repository,
                       ArtifactIngestService ingestService = ArtifactIngestService(),
                       ArtifactRetrievalService retrievalService = ArtifactRetrievalService());

    struct UpsertResult {
        long long songId;
        ArtifactIngestService::IngestOutcome ingest;
    };

    /**
     * @brief Parses the JSON upload body.
     * @throws transport::RequestError non-object body or missing fields; the
     *         message lists every missing key.
     */
    static domain::SongUpload parseUpload(const std::string& jsonBody);

    /**
     * @brief Ingests the archive and upserts the row keyed on file name.
     * @throws transport::TransportError subclasses from ingest or storage.
     */
    UpsertResult upsert(const domain::SongUpload& upload);

    /**
     * @brief Swaps the stored archive of an existing song, keeping its
     *        metadata. The bytes pass the same gates as an upload.
     * @return The ingest outcome, or nullopt when no song has this id.
     */
    std::optional<ArtifactIngestService::IngestOutcome> replaceArtifact(
        long long songId, const domain::transport::RawArtifact& artifact);

    /** @return nullopt when no song has this id. */
    std::optional<ArtifactRetrievalService::RetrievedArtifact> fetchArtifact(long long songId);

private:
    std::shared_ptr<domain::SongRepository> m_repository;
    ArtifactIngestService m_ingestService;
    ArtifactRetrievalService m_retrievalService;
};

} // namespace scoreshelf::application
