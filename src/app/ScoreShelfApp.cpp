/**
 * @file ScoreShelfApp.cpp
 * @brief Implementation of ScoreShelfApp.
 */

#include "app/ScoreShelfApp.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "infrastructure/FileSongRepository.hpp"
#include "infrastructure/InMemorySongRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include <chrono>
#include <iostream>
#include <thread>

namespace scoreshelf::app {

ScoreShelfApp::ScoreShelfApp(std::string configPath)
    : m_configPath(std::move(configPath)) {}

bool ScoreShelfApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_configPath);

    try {
        if (m_config.storage == infrastructure::StorageBackend::Memory) {
            m_services.songRepository = std::make_shared<infrastructure::InMemorySongRepository>();
            std::cout << "[ScoreShelfApp] Using in-memory song storage." << std::endl;
        } else {
            std::string storePath = m_config.storePath.empty()
                ? infrastructure::PathUtils::GetDefaultStorePath().string()
                : m_config.storePath;
            m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
            m_services.songRepository = std::make_shared<infrastructure::FileSongRepository>(
                storePath, m_services.persistenceService);
            std::cout << "[ScoreShelfApp] Using song store " << storePath << std::endl;
        }
    } catch (const domain::transport::StorageError& e) {
        std::cerr << "[ScoreShelfApp] Cannot open song storage: " << e.what() << std::endl;
        return false;
    }

    m_services.catalogService = std::make_shared<application::SongCatalogService>(
        m_services.songRepository,
        application::ArtifactIngestService(m_config.maxArtifactBytes));

    auto controller = std::make_shared<infrastructure::http::SongHttpController>(
        m_services.catalogService, m_config.debugEndpoints);
    m_server = std::make_unique<infrastructure::http::HttpServer>(controller, m_config.maxArtifactBytes);
    return true;
}

int ScoreShelfApp::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }
    if (m_stopRequested) {
        std::cout << "[ScoreShelfApp] Stop requested during startup." << std::endl;
        Shutdown();
        return 0;
    }

    // Signal handlers only set the flag; this thread turns it into stop().
    std::atomic<bool> serverDone{false};
    std::thread stopWatcher([this, &serverDone] {
        while (!serverDone) {
            if (m_stopRequested && m_server->isRunning()) {
                m_server->stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    bool ok = m_server->listen(m_config.host, m_config.port);
    serverDone = true;
    stopWatcher.join();

    Shutdown();
    return ok ? 0 : 1;
}

void ScoreShelfApp::RequestStop() {
    m_stopRequested = true;
}

void ScoreShelfApp::Shutdown() {
    if (m_server) {
        m_server->stop();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
    }
    std::cout << "[ScoreShelfApp] Shutdown complete." << std::endl;
}

} // namespace scoreshelf::app
