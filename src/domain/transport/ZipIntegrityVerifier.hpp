/**
 * @file ZipIntegrityVerifier.hpp
 * @brief Structural plausibility checks for ZIP containers.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "domain/transport/RawArtifact.hpp"
#include "domain/transport/ZipIntegrityReport.hpp"

namespace scoreshelf::domain::transport {

/**
 * @class ZipIntegrityVerifier
 * @brief Decides whether a buffer is a complete ZIP container without
 *        parsing its central directory.
 *
 * Two checks: the leading magic number (mandatory at ingest) and the
 * End-Of-Central-Directory completeness check (advisory).
 */
class ZipIntegrityVerifier {
public:
    static constexpr std::size_t kEocdFixedSize = 22;
    static constexpr std::size_t kMaxCommentLength = 65535;
    static constexpr std::size_t kCommentLengthOffset = 20;
    static constexpr std::array<std::uint8_t, 4> kEocdSignature = {0x50, 0x4B, 0x05, 0x06};

    /**
     * @brief True when the first four bytes are exactly PK 03 04, PK 05 06
     *        or PK 07 08.
     */
    static bool hasZipMagic(const std::vector<std::uint8_t>& bytes);

    /** @throws NotAZipArchiveError */
    static void requireZipMagic(const RawArtifact& artifact);

    /**
     * @brief Locates the EOCD record and compares its declared end with the
     *        buffer length.
     *
     * The record is searched forward from max(0, size - (22 + 65535)); the
     * first signature found wins.
     */
    static ZipIntegrityReport inspect(const std::vector<std::uint8_t>& bytes);

    static ZipIntegrityReport inspect(const RawArtifact& artifact) {
        return inspect(artifact.bytes());
    }
};

} // namespace scoreshelf::domain::transport
