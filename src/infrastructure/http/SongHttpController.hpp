/**
 * @file SongHttpController.hpp
 * @brief Maps catalog operations and their errors onto HTTP replies.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "application/SongCatalogService.hpp"
#include "domain/transport/TransportErrors.hpp"

namespace scoreshelf::infrastructure::http {

/**
 * @struct HttpReply
 * @brief Transport-neutral response, copied into the server's response type.
 */
struct HttpReply {
    int status = 200;
    std::string contentType;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    /** @brief Value of the first header with this name, or "". */
    std::string header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (key == name) return value;
        }
        return "";
    }
};

/**
 * @class SongHttpController
 * @brief The single place where exceptions become status codes.
 *
 * No handler lets an exception escape.
 */
class SongHttpController {
public:
    SongHttpController(std::shared_ptr<application::SongCatalogService> catalog, bool debugEndpoints = false);

    /** @brief POST /api/song */
    HttpReply createSong(const std::string& body);

    /** @brief GET /api/song/{id}/mxl */
    HttpReply getSongMxl(const std::string& idParam, bool debugRequested = false);

    /** @brief GET /api/health */
    HttpReply health() const;

    /** @brief GET /api/version */
    HttpReply version() const;

    /** @brief encodeURIComponent over UTF-8 bytes. */
    static std::string PercentEncode(const std::string& value);

    /** @brief Digits only and > 0; anything else is nullopt. */
    static std::optional<long long> ParseSongId(const std::string& idParam);

    /** @brief {"ok":false,"error":code,"message":message} */
    static HttpReply ErrorReply(int status, const std::string& code, const std::string& message);

    /** @brief Status and public code for an error raised while storing. */
    static HttpReply IngestErrorReply(const domain::transport::TransportError& error);

private:
    std::shared_ptr<application::SongCatalogService> m_catalog;
    bool m_debugEndpoints;
};

} // namespace scoreshelf::infrastructure::http
