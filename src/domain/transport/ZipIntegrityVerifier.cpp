/**
 * @file ZipIntegrityVerifier.cpp
 * @brief Implementation of ZipIntegrityVerifier.
 */

#include "domain/transport/ZipIntegrityVerifier.hpp"
#include "domain/transport/TransportErrors.hpp"
#include <algorithm>
#include <cstdio>
#include <string>

namespace scoreshelf::domain::transport {

namespace {

std::string leadingBytesHex(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    char buf[4];
    const std::size_t count = std::min<std::size_t>(bytes.size(), 4);
    for (std::size_t i = 0; i < count; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", bytes[i]);
        if (i > 0) out += ' ';
        out += buf;
    }
    return out.empty() ? "<none>" : out;
}

} // namespace

bool ZipIntegrityVerifier::hasZipMagic(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 4 || bytes[0] != 0x50 || bytes[1] != 0x4B) { // "PK"
        return false;
    }
    // Local file header, empty-archive EOCD, spanned-archive marker.
    return (bytes[2] == 0x03 && bytes[3] == 0x04) ||
           (bytes[2] == 0x05 && bytes[3] == 0x06) ||
           (bytes[2] == 0x07 && bytes[3] == 0x08);
}

void ZipIntegrityVerifier::requireZipMagic(const RawArtifact& artifact) {
    if (!hasZipMagic(artifact.bytes())) {
        throw NotAZipArchiveError("Song bytes must be compressed .mxl (ZIP) format; leading bytes: " +
                                  leadingBytesHex(artifact.bytes()));
    }
}

ZipIntegrityReport ZipIntegrityVerifier::inspect(const std::vector<std::uint8_t>& bytes) {
    ZipIntegrityReport report;
    const std::size_t total = bytes.size();
    const std::size_t window = kEocdFixedSize + kMaxCommentLength;
    const std::size_t windowStart = total > window ? total - window : 0;

    auto found = std::search(bytes.begin() + static_cast<std::ptrdiff_t>(windowStart), bytes.end(),
                             kEocdSignature.begin(), kEocdSignature.end());
    if (found == bytes.end()) {
        report.ok = false;
        report.status = ZipCompleteness::MissingEocd;
        return report;
    }

    const auto offset = static_cast<std::size_t>(found - bytes.begin());
    report.eocdOffset = offset;

    // The comment-length field itself lies past the end of the buffer.
    if (offset + kEocdFixedSize > total) {
        report.ok = false;
        report.status = ZipCompleteness::Truncated;
        report.missingBytes = offset + kEocdFixedSize - total;
        return report;
    }

    report.commentLength = static_cast<std::size_t>(bytes[offset + kCommentLengthOffset]) |
                           (static_cast<std::size_t>(bytes[offset + kCommentLengthOffset + 1]) << 8);
    const std::size_t expectedEnd = offset + kEocdFixedSize + report.commentLength;

    if (expectedEnd == total) {
        report.ok = true;
        report.status = ZipCompleteness::Exact;
    } else if (expectedEnd < total) {
        report.ok = true;
        report.status = ZipCompleteness::TrailingBytes;
        report.trailingBytes = total - expectedEnd;
    } else {
        report.ok = false;
        report.status = ZipCompleteness::Truncated;
        report.missingBytes = expectedEnd - total;
    }
    return report;
}

} // namespace scoreshelf::domain::transport
