/**
 * @file ArchiveDiagnostics.hpp
 * @brief Offline report on an archive file, for operators checking uploads.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/transport/ZipIntegrityReport.hpp"

namespace scoreshelf::application {

struct ArchiveCheck {
    std::string path;
    std::size_t bytes = 0;
    std::string headHex; ///< First four bytes, lowercase, no separators.
    domain::transport::ZipIntegrityReport integrity;
    bool hasZipMagic = false;
};

class ArchiveDiagnostics {
public:
    /** @brief Works on any buffer, including an empty one. */
    static ArchiveCheck Check(const std::string& path, const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Flat report: path, bytes, head_hex, zip_magic, eocd_found,
     *        eocd_offset (-1 when absent), comment_len, zip_ok, status,
     *        missing_bytes, trailing_bytes.
     */
    static nlohmann::json ToJson(const ArchiveCheck& check);
};

} // namespace scoreshelf::application
