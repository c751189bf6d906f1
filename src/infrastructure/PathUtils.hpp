/**
 * @file PathUtils.hpp
 * @brief XDG locations for the server's settings and song store.
 */

#pragma once
#include <filesystem>

namespace scoreshelf::infrastructure {

class PathUtils {
public:
    /** @brief $SCORESHELF_HOME, else $XDG_DATA_HOME/ScoreShelf, else ~/.local/share/ScoreShelf. */
    static std::filesystem::path GetDataHome();

    /** @brief $XDG_CONFIG_HOME/ScoreShelf, else ~/.config/ScoreShelf. */
    static std::filesystem::path GetConfigHome();

    /** @brief songs.json under GetDataHome(); creates the directory. */
    static std::filesystem::path GetDefaultStorePath();
};

} // namespace scoreshelf::infrastructure
