/**
 * @file ScoreShelfApp.hpp
 * @brief Process entry point for the ScoreShelf server.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/http/HttpServer.hpp"

namespace scoreshelf::app {

/**
 * @class ScoreShelfApp
 * @brief Orchestrates configuration, construction of the storage handle and
 *        services, the server loop, and shutdown.
 */
class ScoreShelfApp {
public:
    explicit ScoreShelfApp(std::string configPath);

    /**
     * @brief Starts the server and blocks until it stops.
     * @return Exit code (0 for success).
     */
    int Run();

    /**
     * @brief Asks Run() to return. Safe from a signal handler and before the
     *        server has started; a request made during Init() skips listen().
     */
    void RequestStop();

private:
    /**
     * @brief Loads settings and builds every service.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Stops the server and drains pending store writes. */
    void Shutdown();

    std::string m_configPath;
    infrastructure::ServerConfig m_config;
    application::AppServices m_services;
    std::unique_ptr<infrastructure::http::HttpServer> m_server;
    std::atomic<bool> m_stopRequested{false};
};

} // namespace scoreshelf::app
