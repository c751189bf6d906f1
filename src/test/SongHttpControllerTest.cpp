#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

#include "application/SongCatalogService.hpp"
#include "domain/SongRepository.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "infrastructure/InMemorySongRepository.hpp"
#include "infrastructure/http/SongHttpController.hpp"
#include "test/TestSupport.hpp"

using namespace scoreshelf;
using namespace scoreshelf::infrastructure::http;
using namespace scoreshelf::test;
using json = nlohmann::json;

// Storage stub returning hand-picked column values.
class FixedSongRepository : public domain::SongRepository {
public:
    long long upsertSong(const domain::SongRecord&) override {
        throw domain::transport::StorageError("write refused by stub");
    }

    bool replaceSongMxl(long long, const std::string&, const std::string&) override {
        throw domain::transport::StorageError("write refused by stub");
    }

    std::optional<domain::StoredSongArtifact> findSongArtifact(long long songId) override {
        auto it = rows.find(songId);
        if (it == rows.end()) return std::nullopt;
        return it->second;
    }

    std::map<long long, domain::StoredSongArtifact> rows;
};

namespace {

json uploadBody(const std::string& fileName, const std::string& title, const std::string& base64) {
    return json{
        {"song_title", title},
        {"composer_first_name", "Ludwig"},
        {"composer_last_name", "Beethoven"},
        {"skill_level_name", "Advanced"},
        {"file_name", fileName},
        {"song_mxl_base64", base64}
    };
}

SongHttpController makeController(bool debug = false) {
    auto repo = std::make_shared<infrastructure::InMemorySongRepository>();
    return SongHttpController(std::make_shared<application::SongCatalogService>(repo), debug);
}

void testUploadThenDownload() {
    auto controller = makeController();
    auto created = controller.createSong(uploadBody("fifth.mxl", "Symphony No. 5", kMinimalEmptyZipBase64).dump());
    assert(created.status == 200);
    auto body = json::parse(created.body);
    assert(body["ok"] == true);
    const long long id = body["song_id"].get<long long>();

    auto download = controller.getSongMxl(std::to_string(id));
    assert(download.status == 200);
    assert(download.contentType == "application/vnd.recordare.musicxml+zip");
    const Bytes expected = MinimalEmptyZip();
    assert(download.body == std::string(expected.begin(), expected.end()));
    assert(download.header("Cache-Control") == "no-store");
    assert(download.header("Content-Disposition") == "inline; filename=\"Symphony%20No.%205.mxl\"");
    std::cout << "[PASS] upload and download" << std::endl;
}

void testUploadErrors() {
    auto controller = makeController();

    auto gif = controller.createSong(uploadBody("a.mxl", "A", "R0lGODlhAQABAA==").dump());
    assert(gif.status == 400);
    assert(json::parse(gif.body)["error"] == "payload_not_mxl_zip");
    assert(json::parse(gif.body)["ok"] == false);

    auto garbage = controller.createSong(uploadBody("a.mxl", "A", "***").dump());
    assert(garbage.status == 400);
    assert(json::parse(garbage.body)["error"] == "invalid_base64");

    auto missing = controller.createSong(R"({"song_title":"A"})");
    assert(missing.status == 400);
    assert(json::parse(missing.body)["error"] == "bad_request");

    auto notJson = controller.createSong("song_title=A");
    assert(notJson.status == 400);
    assert(json::parse(notJson.body)["message"] == "Invalid JSON body");

    assert(controller.createSong(uploadBody("x.mxl", "Same", kMinimalEmptyZipBase64).dump()).status == 200);
    auto duplicate = controller.createSong(uploadBody("y.mxl", "Same", kMinimalEmptyZipBase64).dump());
    assert(duplicate.status == 409);
    assert(json::parse(duplicate.body)["error"] == "duplicate_song_metadata");
    std::cout << "[PASS] upload error mapping" << std::endl;
}

void testPayloadTooLarge() {
    auto repo = std::make_shared<infrastructure::InMemorySongRepository>();
    auto catalog = std::make_shared<application::SongCatalogService>(repo, application::ArtifactIngestService(10));
    SongHttpController controller(catalog);
    auto reply = controller.createSong(uploadBody("big.mxl", "Big", kMinimalEmptyZipBase64).dump());
    assert(reply.status == 413);
    assert(json::parse(reply.body)["error"] == "payload_too_large");
    std::cout << "[PASS] payload too large" << std::endl;
}

void testIdValidation() {
    auto controller = makeController();
    for (const char* bad : {"abc", "-1", "0", "1e3", "", "12a", "0x10", "1234567890123456789"}) {
        auto reply = controller.getSongMxl(bad);
        assert(reply.status == 400);
        assert(json::parse(reply.body)["error"] == "bad_request");
    }
    auto missing = controller.getSongMxl("41");
    assert(missing.status == 404);
    assert(json::parse(missing.body)["error"] == "not_found");
    std::cout << "[PASS] id validation and not found" << std::endl;
}

void testStoredValueFailures() {
    auto repo = std::make_shared<FixedSongRepository>();
    repo->rows[1] = domain::StoredSongArtifact{json(nullptr), std::string("Null")};
    repo->rows[2] = domain::StoredSongArtifact{json::object({{"type", "Buffer"}}), std::nullopt};
    repo->rows[3] = domain::StoredSongArtifact{json("\\x50zz"), std::nullopt};
    repo->rows[4] = domain::StoredSongArtifact{json::array({80, 75, 5, 6, 0, 0, 0, 0, 0, 0, 0, 0,
                                                            0, 0, 0, 0, 0, 0, 0, 0, 0, 0}), std::nullopt};
    SongHttpController controller(std::make_shared<application::SongCatalogService>(repo));

    for (const char* id : {"1", "2", "3"}) {
        auto reply = controller.getSongMxl(id);
        assert(reply.status == 500);
        assert(!reply.body.empty());
        assert(reply.contentType == "application/json");
        assert(json::parse(reply.body)["error"] == "server_error");
    }
    assert(json::parse(controller.getSongMxl("1").body)["message"] == "stored artifact is null");

    auto fromArray = controller.getSongMxl("4");
    assert(fromArray.status == 200);
    assert(fromArray.body.size() == 22);
    assert(fromArray.header("Content-Disposition") == "inline; filename=\"score.mxl\"");

    auto write = controller.createSong(uploadBody("w.mxl", "W", kMinimalEmptyZipBase64).dump());
    assert(write.status == 500);
    assert(json::parse(write.body)["error"] == "server_error");
    std::cout << "[PASS] stored value failures surface as server_error" << std::endl;
}

void testDebugSurface() {
    auto disabled = makeController(false);
    disabled.createSong(uploadBody("d.mxl", "D", kMinimalEmptyZipBase64).dump());
    assert(disabled.getSongMxl("1", true).contentType == "application/vnd.recordare.musicxml+zip");

    auto enabled = makeController(true);
    enabled.createSong(uploadBody("d.mxl", "D", kMinimalEmptyZipBase64).dump());
    auto reply = enabled.getSongMxl("1", true);
    assert(reply.status == 200);
    auto body = json::parse(reply.body);
    assert(body["byteLength"] == 22);
    assert(body["zip"]["status"] == "exact");
    assert(body["zip"]["eocdOffset"] == 0);
    assert(body["storedEncoding"] == "hex");
    std::cout << "[PASS] debug surface" << std::endl;
}

void testPercentEncoding() {
    assert(SongHttpController::PercentEncode("Gymnopédie No. 1.mxl") == "Gymnop%C3%A9die%20No.%201.mxl");
    assert(SongHttpController::PercentEncode("a\"b/c?.mxl") == "a%22b%2Fc%3F.mxl");
    assert(SongHttpController::PercentEncode("A-Z_a.z!~*'()") == "A-Z_a.z!~*'()");
    std::cout << "[PASS] percent encoding" << std::endl;
}

void testHealthAndVersion() {
    auto controller = makeController();
    auto health = json::parse(controller.health().body);
    assert(health["ok"] == true);
    assert(health["ts"].get<std::string>().back() == 'Z');
    auto version = json::parse(controller.version().body);
    assert(version["name"] == "scoreshelf");
    assert(version["version"].is_string());
    std::cout << "[PASS] health and version" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SongHttpController tests..." << std::endl;
    testUploadThenDownload();
    testUploadErrors();
    testPayloadTooLarge();
    testIdValidation();
    testStoredValueFailures();
    testDebugSurface();
    testPercentEncoding();
    testHealthAndVersion();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
