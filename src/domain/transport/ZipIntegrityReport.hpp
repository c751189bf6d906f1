/**
 * @file ZipIntegrityReport.hpp
 * @brief Diagnostic result of one ZIP completeness check.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace scoreshelf::domain::transport {

/**
 * @enum ZipCompleteness
 * @brief Where the declared end of the archive falls relative to the buffer.
 */
enum class ZipCompleteness {
    Exact,         ///< Declared end equals buffer length.
    TrailingBytes, ///< Bytes follow the declared comment; still acceptable.
    Truncated,     ///< Buffer ends before the declared end.
    MissingEocd    ///< No EOCD signature in the search window.
};

/**
 * @struct ZipIntegrityReport
 * @brief Produced per validation call, never persisted.
 */
struct ZipIntegrityReport {
    bool ok = false;
    std::optional<std::size_t> eocdOffset;
    std::size_t commentLength = 0;
    std::size_t missingBytes = 0;
    std::size_t trailingBytes = 0;
    ZipCompleteness status = ZipCompleteness::MissingEocd;

    static std::string StatusToString(ZipCompleteness status) {
        switch (status) {
            case ZipCompleteness::Exact: return "exact";
            case ZipCompleteness::TrailingBytes: return "trailing_bytes";
            case ZipCompleteness::Truncated: return "truncated";
            case ZipCompleteness::MissingEocd: return "missing_eocd";
        }
        return "missing_eocd";
    }
};

} // namespace scoreshelf::domain::transport
