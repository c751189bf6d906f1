/**
 * @file SongHttpController.cpp
 * @brief Implementation of SongHttpController.
 */

#include "infrastructure/http/SongHttpController.hpp"
#include "domain/transport/ZipIntegrityReport.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>

#ifndef SCORESHELF_VERSION
#define SCORESHELF_VERSION "0.0.0"
#endif

namespace scoreshelf::infrastructure::http {

using json = nlohmann::json;
using namespace scoreshelf::domain::transport;

namespace {

const std::string kJsonContentType = "application/json";

json integrityToJson(const ZipIntegrityReport& report) {
    json j = {
        {"ok", report.ok},
        {"status", ZipIntegrityReport::StatusToString(report.status)},
        {"eocdOffset", nullptr},
        {"commentLength", report.commentLength},
        {"missingBytes", report.missingBytes},
        {"trailingBytes", report.trailingBytes}
    };
    if (report.eocdOffset) {
        j["eocdOffset"] = *report.eocdOffset;
    }
    return j;
}

HttpReply jsonReply(int status, const json& body) {
    HttpReply reply;
    reply.status = status;
    reply.contentType = kJsonContentType;
    reply.body = body.dump();
    return reply;
}

} // namespace

SongHttpController::SongHttpController(std::shared_ptr<application::SongCatalogService> catalog, bool debugEndpoints)
    : m_catalog(std::move(catalog)), m_debugEndpoints(debugEndpoints) {}

HttpReply SongHttpController::ErrorReply(int status, const std::string& code, const std::string& message) {
    return jsonReply(status, json{{"ok", false}, {"error", code}, {"message", message}});
}

HttpReply SongHttpController::IngestErrorReply(const TransportError& error) {
    const std::string& code = error.code();
    if (code == "bad_request" || code == "invalid_base64" || code == "payload_not_mxl_zip") {
        return ErrorReply(400, code, error.what());
    }
    if (code == "payload_too_large") {
        return ErrorReply(413, code, error.what());
    }
    if (code == "duplicate_song_metadata") {
        return ErrorReply(409, code, error.what());
    }
    return ErrorReply(500, "server_error", error.what());
}

HttpReply SongHttpController::createSong(const std::string& body) {
    try {
        auto upload = application::SongCatalogService::parseUpload(body);
        auto result = m_catalog->upsert(upload);
        return jsonReply(200, json{{"ok", true}, {"song_id", result.songId}});
    } catch (const TransportError& e) {
        HttpReply reply = IngestErrorReply(e);
        std::cerr << "[SongHttpController] POST /api/song rejected (" << reply.status << " "
                  << e.code() << "): " << e.what() << std::endl;
        return reply;
    } catch (const std::exception& e) {
        std::cerr << "[SongHttpController] POST /api/song failed: " << e.what() << std::endl;
        return ErrorReply(500, "server_error", e.what());
    }
}

HttpReply SongHttpController::getSongMxl(const std::string& idParam, bool debugRequested) {
    auto songId = ParseSongId(idParam);
    if (!songId) {
        return ErrorReply(400, "bad_request", "id must be a positive integer");
    }

    try {
        auto retrieved = m_catalog->fetchArtifact(*songId);
        if (!retrieved) {
            return ErrorReply(404, "not_found", "Song not found");
        }

        if (debugRequested && m_debugEndpoints) {
            return jsonReply(200, json{
                {"ok", true},
                {"byteLength", retrieved->artifact.size()},
                {"storedEncoding", retrieved->storedEncoding},
                {"zip", integrityToJson(retrieved->integrity)}
            });
        }

        HttpReply reply;
        reply.status = 200;
        reply.contentType = retrieved->descriptor.mimeType;
        reply.body = retrieved->artifact.toBinaryString();
        reply.headers.emplace_back("Content-Disposition",
            "inline; filename=\"" + PercentEncode(retrieved->descriptor.suggestedFilename) + "\"");
        reply.headers.emplace_back("Cache-Control", "no-store");
        return reply;
    } catch (const TransportError& e) {
        std::cerr << "[SongHttpController] GET song " << *songId << " failed to decode ("
                  << e.code() << "): " << e.what() << std::endl;
        return ErrorReply(500, "server_error", e.what());
    } catch (const std::exception& e) {
        std::cerr << "[SongHttpController] GET song " << *songId << " failed: " << e.what() << std::endl;
        return ErrorReply(500, "server_error", e.what());
    }
}

HttpReply SongHttpController::health() const {
    return jsonReply(200, json{{"ok", true}, {"ts", TimeUtils::NowIsoUtc()}});
}

HttpReply SongHttpController::version() const {
    const char* commit = std::getenv("SCORESHELF_GIT_COMMIT");
    json body = {
        {"name", "scoreshelf"},
        {"version", SCORESHELF_VERSION},
        {"commit", nullptr}
    };
    if (commit && *commit) {
        body["commit"] = commit;
    }
    return jsonReply(200, body);
}

std::string SongHttpController::PercentEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '!' || c == '~' ||
                                c == '*' || c == '\'' || c == '(' || c == ')';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::optional<long long> SongHttpController::ParseSongId(const std::string& idParam) {
    if (idParam.empty() || idParam.size() > 18) {
        return std::nullopt;
    }
    long long value = 0;
    for (char c : idParam) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace scoreshelf::infrastructure::http
