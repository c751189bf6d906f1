/**
 * @file ArtifactRetrievalService.hpp
 * @brief Rebuilds the exact archive bytes from whatever storage returned.
 */

#pragma once

#include <string>
#include "domain/Song.hpp"
#include "domain/transport/ContentDescriptor.hpp"
#include "domain/transport/RawArtifact.hpp"
#include "domain/transport/ZipIntegrityReport.hpp"

namespace scoreshelf::application {

/**
 * @class ArtifactRetrievalService
 * @brief Sniffs, decodes and describes a stored artifact.
 */
class ArtifactRetrievalService {
public:
    struct RetrievedArtifact {
        domain::transport::RawArtifact artifact;
        domain::transport::ContentDescriptor descriptor;
        domain::transport::ZipIntegrityReport integrity; ///< Advisory only.
        std::string storedEncoding;                      ///< "hex", "base64" or "native".
    };

    /**
     * @brief Never returns partially decoded bytes: any failure throws.
     * @throws transport::EmptyPayloadError, transport::DecodeError,
     *         transport::UnsupportedEncodingError
     */
    RetrievedArtifact retrieve(const domain::StoredSongArtifact& stored) const;
};

} // namespace scoreshelf::application
