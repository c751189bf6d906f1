/**
 * @file ArtifactIngestService.cpp
 * @brief Implementation of ArtifactIngestService.
 */

#include "application/ArtifactIngestService.hpp"
#include "domain/transport/ArtifactCodec.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "domain/transport/ZipIntegrityVerifier.hpp"
#include <iostream>
#include <optional>

namespace scoreshelf::application {

using namespace scoreshelf::domain::transport;

ArtifactIngestService::ArtifactIngestService(std::size_t maxArtifactBytes)
    : m_maxArtifactBytes(maxArtifactBytes) {}

ArtifactIngestService::IngestOutcome ArtifactIngestService::ingest(const std::string& base64Text) const {
    std::optional<RawArtifact> artifact;
    try {
        artifact.emplace(ArtifactCodec::decodeBase64(base64Text));
    } catch (const DecodeError& e) {
        throw InvalidBase64Error(std::string("song_mxl_base64 is not valid base64: ") + e.what());
    }

    return ingestBytes(*artifact);
}

ArtifactIngestService::IngestOutcome ArtifactIngestService::ingestBytes(const RawArtifact& artifact) const {
    if (artifact.size() > m_maxArtifactBytes) {
        throw PayloadTooLargeError("Song archive is " + std::to_string(artifact.size()) +
                                   " bytes; the limit is " + std::to_string(m_maxArtifactBytes));
    }

    ZipIntegrityVerifier::requireZipMagic(artifact);

    IngestOutcome outcome;
    outcome.integrity = ZipIntegrityVerifier::inspect(artifact);
    if (!outcome.integrity.ok) {
        std::cerr << "[ArtifactIngestService] Accepting archive with incomplete EOCD ("
                  << ZipIntegrityReport::StatusToString(outcome.integrity.status)
                  << ", missing " << outcome.integrity.missingBytes << " bytes)" << std::endl;
    }
    outcome.byteLength = artifact.size();
    outcome.canonicalHex = ArtifactCodec::encodeHex(artifact);
    return outcome;
}

} // namespace scoreshelf::application
