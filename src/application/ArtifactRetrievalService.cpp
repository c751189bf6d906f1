/**
 * @file ArtifactRetrievalService.cpp
 * @brief Implementation of ArtifactRetrievalService.
 */

#include "application/ArtifactRetrievalService.hpp"
#include "domain/transport/ArtifactCodec.hpp"
#include "domain/transport/EncodingSniffer.hpp"
#include "domain/transport/ZipIntegrityVerifier.hpp"
#include <iostream>

namespace scoreshelf::application {

using namespace scoreshelf::domain::transport;

ArtifactRetrievalService::RetrievedArtifact ArtifactRetrievalService::retrieve(
    const domain::StoredSongArtifact& stored) const {
    EncodedText encoded = EncodingSniffer::classify(stored.songMxl);
    std::string encoding = EncodingToString(encoded);
    RawArtifact artifact = ArtifactCodec::decode(encoded);

    ZipIntegrityReport integrity = ZipIntegrityVerifier::inspect(artifact);
    if (!integrity.ok) {
        std::cerr << "[ArtifactRetrievalService] Stored " << encoding << " archive failed EOCD check ("
                  << ZipIntegrityReport::StatusToString(integrity.status) << ", "
                  << artifact.size() << " bytes, missing " << integrity.missingBytes << ")" << std::endl;
    }

    return RetrievedArtifact{std::move(artifact),
                             ContentDescriptor::ForScoreTitle(stored.songTitle),
                             integrity,
                             std::move(encoding)};
}

} // namespace scoreshelf::application
