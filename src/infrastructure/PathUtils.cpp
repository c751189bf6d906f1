/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <iostream>
#include <system_error>

namespace scoreshelf::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* kAppDirName = "ScoreShelf";

const char* nonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// $xdgVar, else $HOME/<homeRelative>, else the working directory.
fs::path xdgBase(const char* xdgVar, const fs::path& homeRelative) {
    if (const char* xdg = nonEmptyEnv(xdgVar)) {
        return fs::path(xdg);
    }
    if (const char* home = nonEmptyEnv("HOME")) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    if (const char* home = nonEmptyEnv("SCORESHELF_HOME")) {
        return fs::path(home);
    }
    return xdgBase("XDG_DATA_HOME", fs::path(".local") / "share") / kAppDirName;
}

fs::path PathUtils::GetConfigHome() {
    return xdgBase("XDG_CONFIG_HOME", ".config") / kAppDirName;
}

fs::path PathUtils::GetDefaultStorePath() {
    fs::path base = GetDataHome();
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
    }
    return base / "songs.json";
}

} // namespace scoreshelf::infrastructure
