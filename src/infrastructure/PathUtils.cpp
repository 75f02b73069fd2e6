/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace shelfsense::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDirectory = "ShelfSense";

// $xdgVariable if set and non-empty, else $HOME/homeRelative, else the working directory.
fs::path XdgBase(const char* xdgVariable, const fs::path& homeRelative) {
    const char* explicitBase = std::getenv(xdgVariable);
    if (explicitBase && *explicitBase) {
        return fs::path(explicitBase);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::DataDirectory() {
    return XdgBase("XDG_DATA_HOME", fs::path(".local") / "share") / kAppDirectory;
}

fs::path PathUtils::ConfigDirectory() {
    return XdgBase("XDG_CONFIG_HOME", ".config") / kAppDirectory;
}

fs::path PathUtils::DefaultModelPath() {
    return DataDirectory() / "shelf_life_model.json";
}

fs::path PathUtils::DefaultHistoryPath() {
    return DataDirectory() / "prediction_history.json";
}

fs::path PathUtils::DefaultSettingsPath() {
    return ConfigDirectory() / "settings.json";
}

} // namespace shelfsense::infrastructure
