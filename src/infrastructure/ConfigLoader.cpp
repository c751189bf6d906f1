/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scoreshelf::infrastructure {

ServerConfig ConfigLoader::Load(const std::string& configPath) {
    std::filesystem::path path(configPath);
    if (!std::filesystem::exists(path)) {
        std::cerr << "[ConfigLoader] " << configPath << " not found, using defaults." << std::endl;
        return ServerConfig{};
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                  << ". Using defaults." << std::endl;
    }
    return ServerConfig{};
}

ServerConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    ServerConfig config;
    if (!j.is_object()) {
        throw std::invalid_argument("settings root must be an object");
    }

    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    if (config.port <= 0 || config.port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(config.port));
    }

    const std::string storage = j.value("storage", std::string("file"));
    if (storage == "file") {
        config.storage = StorageBackend::File;
    } else if (storage == "memory") {
        config.storage = StorageBackend::Memory;
    } else {
        throw std::invalid_argument("unknown storage backend: " + storage);
    }

    config.storePath = j.value("store_path", config.storePath);
    config.maxArtifactBytes = j.value("max_artifact_bytes", config.maxArtifactBytes);
    if (config.maxArtifactBytes == 0) {
        throw std::invalid_argument("max_artifact_bytes must be positive");
    }
    config.debugEndpoints = j.value("debug_endpoints", config.debugEndpoints);
    return config;
}

} // namespace scoreshelf::infrastructure
