/**
 * @file UpdateSongMain.cpp
 * @brief scoreshelf_update_song: replaces one song's archive with a file from disk.
 *
 * Works on the file-backed store named by settings.json. Run it while the
 * server is stopped; the server keeps its own copy of the table in memory.
 */

#include <iostream>
#include <memory>
#include <string>

#include "application/SongCatalogService.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "infrastructure/ArchiveFileReader.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileSongRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/http/SongHttpController.hpp"

using namespace scoreshelf;

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: scoreshelf_update_song <song_id> <path-to-file.mxl> [settings.json]" << std::endl;
        return 1;
    }

    auto songId = infrastructure::http::SongHttpController::ParseSongId(argv[1]);
    if (!songId) {
        std::cerr << "[scoreshelf_update_song] song_id must be a positive integer: " << argv[1] << std::endl;
        return 1;
    }
    const std::string filePath = argv[2];
    const std::string configPath = argc == 4 ? argv[3] : "settings.json";

    auto config = infrastructure::ConfigLoader::Load(configPath);
    if (config.storage != infrastructure::StorageBackend::File) {
        std::cerr << "[scoreshelf_update_song] " << configPath
                  << " selects in-memory storage; there is no store to update." << std::endl;
        return 1;
    }
    const std::string storePath = config.storePath.empty()
        ? infrastructure::PathUtils::GetDefaultStorePath().string()
        : config.storePath;

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    int code = 1;
    try {
        auto repo = std::make_shared<infrastructure::FileSongRepository>(storePath, persistence);
        application::SongCatalogService catalog(repo, application::ArtifactIngestService(config.maxArtifactBytes));

        domain::transport::RawArtifact artifact(infrastructure::ArchiveFileReader::ReadAll(filePath));
        auto outcome = catalog.replaceArtifact(*songId, artifact);
        if (!outcome) {
            std::cerr << "[scoreshelf_update_song] No row updated for song_id=" << *songId << std::endl;
        } else {
            std::cout << "Updated song_id=" << *songId << " with " << outcome->byteLength << " bytes." << std::endl;
            code = 0;
        }
    } catch (const domain::transport::TransportError& e) {
        std::cerr << "[scoreshelf_update_song] " << e.code() << ": " << e.what() << std::endl;
    }
    persistence->stop();
    return code;
}
