/**
 * @file ArtifactIngestService.hpp
 * @brief Turns client base64 into the canonical stored form.
 */

#pragma once

#include <cstddef>
#include <string>
#include "domain/transport/RawArtifact.hpp"
#include "domain/transport/ZipIntegrityReport.hpp"

namespace scoreshelf::application {

/** @brief Default ceiling on a decoded archive (8 MiB). */
constexpr std::size_t kDefaultMaxArtifactBytes = 8 * 1024 * 1024;

/**
 * @class ArtifactIngestService
 * @brief Pure function from client text to a canonical hex value or an error.
 *
 * Only the magic number gates ingest. The EOCD check is evaluated and
 * reported but a truncated archive is still accepted.
 */
class ArtifactIngestService {
public:
    explicit ArtifactIngestService(std::size_t maxArtifactBytes = kDefaultMaxArtifactBytes);

    /**
     * @struct IngestOutcome
     * @brief Value to hand to storage plus diagnostics.
     */
    struct IngestOutcome {
        std::string canonicalHex;
        std::size_t byteLength = 0;
        domain::transport::ZipIntegrityReport integrity;
    };

    /**
     * @throws transport::InvalidBase64Error malformed or empty base64.
     * @throws transport::PayloadTooLargeError decoded size above the ceiling.
     * @throws transport::NotAZipArchiveError magic-number mismatch.
     */
    IngestOutcome ingest(const std::string& base64Text) const;

    /**
     * @brief Same gates as ingest() for bytes that need no decoding, such as
     *        an archive read from disk.
     * @throws transport::PayloadTooLargeError, transport::NotAZipArchiveError
     */
    IngestOutcome ingestBytes(const domain::transport::RawArtifact& artifact) const;

private:
    std::size_t m_maxArtifactBytes;
};

} // namespace scoreshelf::application
