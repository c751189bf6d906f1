/**
 * @file ContentDescriptor.hpp
 * @brief MIME type and filename attached to an artifact at the HTTP boundary.
 */

#pragma once

#include <optional>
#include <string>

namespace scoreshelf::domain::transport {

inline const std::string kMxlMimeType = "application/vnd.recordare.musicxml+zip";
inline const std::string kDefaultScoreTitle = "score";

/**
 * @struct ContentDescriptor
 * @brief Derived from the song title; never stored.
 */
struct ContentDescriptor {
    std::string mimeType;
    std::string suggestedFilename;

    /** @brief "<title>.mxl", or "score.mxl" when the title is absent or empty. */
    static ContentDescriptor ForScoreTitle(const std::optional<std::string>& title) {
        const std::string base = (title && !title->empty()) ? *title : kDefaultScoreTitle;
        return ContentDescriptor{kMxlMimeType, base + ".mxl"};
    }
};

} // namespace scoreshelf::domain::transport
