/**
 * @file ArchiveDiagnostics.cpp
 * @brief Implementation of ArchiveDiagnostics.
 */

#include "application/ArchiveDiagnostics.hpp"
#include "domain/transport/ZipIntegrityVerifier.hpp"
#include <algorithm>

namespace scoreshelf::application {

using domain::transport::ZipIntegrityReport;
using domain::transport::ZipIntegrityVerifier;

ArchiveCheck ArchiveDiagnostics::Check(const std::string& path, const std::vector<std::uint8_t>& bytes) {
    static const char kHex[] = "0123456789abcdef";

    ArchiveCheck check;
    check.path = path;
    check.bytes = bytes.size();
    const std::size_t head = std::min<std::size_t>(bytes.size(), 4);
    for (std::size_t i = 0; i < head; ++i) {
        check.headHex += kHex[bytes[i] >> 4];
        check.headHex += kHex[bytes[i] & 0x0F];
    }
    check.hasZipMagic = ZipIntegrityVerifier::hasZipMagic(bytes);
    check.integrity = ZipIntegrityVerifier::inspect(bytes);
    return check;
}

nlohmann::json ArchiveDiagnostics::ToJson(const ArchiveCheck& check) {
    const auto& report = check.integrity;
    return nlohmann::json{
        {"path", check.path},
        {"bytes", check.bytes},
        {"head_hex", check.headHex},
        {"zip_magic", check.hasZipMagic},
        {"eocd_found", report.eocdOffset.has_value()},
        {"eocd_offset", report.eocdOffset ? static_cast<long long>(*report.eocdOffset) : -1LL},
        {"comment_len", report.commentLength},
        {"zip_ok", report.ok},
        {"status", ZipIntegrityReport::StatusToString(report.status)},
        {"missing_bytes", report.missingBytes},
        {"trailing_bytes", report.trailingBytes}
    };
}

} // namespace scoreshelf::application
