/**
 * @file HttpServer.cpp
 * @brief Implementation of HttpServer.
 */

#include "infrastructure/http/HttpServer.hpp"
#include <httplib.h>
#include <iostream>

namespace scoreshelf::infrastructure::http {

namespace {

// base64 expands 3 -> 4; the rest covers the JSON metadata fields.
constexpr std::size_t kEnvelopeOverheadBytes = 64 * 1024;

void applyReply(const HttpReply& reply, httplib::Response& res) {
    res.status = reply.status;
    for (const auto& [name, value] : reply.headers) {
        res.set_header(name, value);
    }
    res.set_content(reply.body, reply.contentType);
}

// Replies httplib produces on its own (unknown route, body over the limit,
// malformed request) reach the client with an empty body unless filled here.
HttpReply transportErrorReply(int status) {
    switch (status) {
        case 404:
            return SongHttpController::ErrorReply(404, "not_found", "No such route");
        case 413:
            return SongHttpController::ErrorReply(413, "payload_too_large", "Request body exceeds the upload limit");
        default:
            break;
    }
    if (status >= 500) {
        return SongHttpController::ErrorReply(status, "server_error", "Request failed");
    }
    return SongHttpController::ErrorReply(status, "bad_request", "Request could not be processed");
}

} // namespace

HttpServer::HttpServer(std::shared_ptr<SongHttpController> controller, std::size_t maxArtifactBytes)
    : m_controller(std::move(controller)), m_server(std::make_unique<httplib::Server>()) {
    m_server->set_payload_max_length((maxArtifactBytes / 3 + 1) * 4 + kEnvelopeOverheadBytes);
    registerRoutes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::registerRoutes() {
    m_server->Post("/api/song", [this](const httplib::Request& req, httplib::Response& res) {
        applyReply(m_controller->createSong(req.body), res);
    });

    auto serveArtifact = [this](const httplib::Request& req, httplib::Response& res) {
        const bool debug = req.has_param("debug") && req.get_param_value("debug") == "1";
        applyReply(m_controller->getSongMxl(req.matches[1], debug), res);
    };
    m_server->Get(R"(/api/song/([^/]+)/mxl)", serveArtifact);
    m_server->Get(R"(/api/song/([^/]+))", serveArtifact);

    m_server->Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        applyReply(m_controller->health(), res);
    });
    m_server->Get("/api/version", [this](const httplib::Request&, httplib::Response& res) {
        applyReply(m_controller->version(), res);
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        std::cerr << "[HttpServer] Unhandled error on " << req.method << " " << req.path << ": " << message << std::endl;
        applyReply(SongHttpController::ErrorReply(500, "server_error", message), res);
    });

    m_server->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            applyReply(transportErrorReply(res.status), res);
        }
    });

    m_server->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (res.status >= 500) {
            std::cerr << "[HttpServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
        }
    });
}

bool HttpServer::listen(const std::string& host, int port) {
    std::cout << "[HttpServer] Listening on " << host << ":" << port << std::endl;
    bool ok = m_server->listen(host, port);
    if (!ok) {
        std::cerr << "[HttpServer] Could not bind " << host << ":" << port << std::endl;
    }
    return ok;
}

int HttpServer::bindToAnyPort(const std::string& host) {
    int port = m_server->bind_to_any_port(host);
    if (port < 0) {
        std::cerr << "[HttpServer] Could not bind an ephemeral port on " << host << std::endl;
    }
    return port;
}

bool HttpServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

bool HttpServer::isRunning() const {
    return m_server && m_server->is_running();
}

void HttpServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

} // namespace scoreshelf::infrastructure::http
