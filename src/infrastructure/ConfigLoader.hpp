/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading server configuration (settings.json).
 *
 * Every key is optional; absent keys keep their defaults so a missing file
 * still yields a runnable configuration.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace scoreshelf::infrastructure {

/**
 * @enum StorageBackend
 * @brief Which SongRepository implementation the entry point constructs.
 */
enum class StorageBackend {
    File,
    Memory
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    StorageBackend storage = StorageBackend::File;
    std::string storePath;                     ///< Empty: PathUtils default.
    std::size_t maxArtifactBytes = 8 * 1024 * 1024;
    bool debugEndpoints = false;               ///< Enables ?debug=1 on GET.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json at the given path.
     * @return Defaults when the file is missing or malformed (the error is logged).
     */
    static ServerConfig Load(const std::string& configPath);

    /**
     * @brief Applies the recognized keys of an already parsed document.
     * @throws std::invalid_argument for a key holding an unusable value.
     */
    static ServerConfig FromJson(const nlohmann::json& j);
};

} // namespace scoreshelf::infrastructure
