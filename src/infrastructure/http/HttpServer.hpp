/**
 * @file HttpServer.hpp
 * @brief cpp-httplib server exposing the song routes.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "infrastructure/http/SongHttpController.hpp"

namespace httplib {
class Server;
}

namespace scoreshelf::infrastructure::http {

/**
 * @class HttpServer
 * @brief Owns the httplib::Server and wires routes to the controller.
 */
class HttpServer {
public:
    /**
     * @param controller Route handlers.
     * @param maxArtifactBytes Used to size the request body limit (base64 and
     *        JSON envelope overhead included).
     */
    HttpServer(std::shared_ptr<SongHttpController> controller, std::size_t maxArtifactBytes);
    ~HttpServer();

    /** @brief Blocks serving requests until stop() is called. */
    bool listen(const std::string& host, int port);

    /**
     * @brief Binds an ephemeral port without serving yet.
     * @return The bound port, or -1 on failure.
     */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on the socket from bindToAnyPort() until stop(). */
    bool listenAfterBind();

    bool isRunning() const;

    void stop();

private:
    void registerRoutes();

    std::shared_ptr<SongHttpController> m_controller;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace scoreshelf::infrastructure::http
