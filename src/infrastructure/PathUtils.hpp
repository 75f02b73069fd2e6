/**
 * @file PathUtils.hpp
 * @brief Default on-disk locations for ShelfSense files.
 */

#pragma once
#include <filesystem>

namespace shelfsense::infrastructure {

/**
 * @class PathUtils
 * @brief Resolves the XDG base directories and the files ShelfSense keeps in them.
 *
 * Data files live under $XDG_DATA_HOME/ShelfSense (default ~/.local/share),
 * settings under $XDG_CONFIG_HOME/ShelfSense (default ~/.config). Without
 * HOME the current directory is used.
 */
class PathUtils {
public:
    static std::filesystem::path DataDirectory();
    static std::filesystem::path ConfigDirectory();

    static std::filesystem::path DefaultModelPath();
    static std::filesystem::path DefaultHistoryPath();
    static std::filesystem::path DefaultSettingsPath();
};

} // namespace shelfsense::infrastructure
