#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/KineticProfile.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace shelfsense;
using infrastructure::ConfigLoader;

static void Write(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_project_root_config";
    std::filesystem::create_directories(testRoot);
    std::string path = testRoot + "/settings.json";

    // Default locations follow the XDG base directories.
    setenv("XDG_DATA_HOME", "/srv/xdg-data", 1);
    setenv("XDG_CONFIG_HOME", "/srv/xdg-config", 1);
    auto defaults = ConfigLoader::Defaults();
    assert(defaults.modelPath == "/srv/xdg-data/ShelfSense/shelf_life_model.json");
    assert(defaults.historyPath == "/srv/xdg-data/ShelfSense/prediction_history.json");
    assert(infrastructure::PathUtils::DefaultSettingsPath() == "/srv/xdg-config/ShelfSense/settings.json");
    setenv("XDG_DATA_HOME", "", 1);
    setenv("HOME", "/home/operator", 1);
    assert(infrastructure::PathUtils::DefaultHistoryPath() == "/home/operator/.local/share/ShelfSense/prediction_history.json");

    // Missing file: defaults.
    auto settings = ConfigLoader::Load(testRoot + "/absent.json");
    assert(settings.historyLimit == 120);
    assert(settings.alpha.base == 0.35 && settings.alpha.min == 0.1 && settings.alpha.max == 0.8);
    assert(settings.alpha.sensorWeight == 0.30 && settings.alpha.mlWeight == 0.40);
    assert(settings.performanceScope == domain::PerformanceScope::PerProduct);
    assert(settings.kineticProfiles.size() == 5);
    assert(settings.features.temperatureFeature == "Temperature_C");

    // Present keys overlay the defaults.
    Write(path, R"({
        "model_path": "/opt/models/shelf.json",
        "history_path": "/var/lib/shelfsense/history.json",
        "history_limit": 40,
        "performance_scope": "global",
        "alpha": { "base": 0.4, "ml_weight": 0.5 },
        "features": { "product_prefix": "Product_" },
        "kinetic_profiles": {
            "Pear": { "activation_energy": 55000, "pre_exponential_factor": 1e9, "reference_shelf_life_days": 30 }
        }
    })");
    settings = ConfigLoader::Load(path);
    assert(settings.modelPath == "/opt/models/shelf.json");
    assert(settings.historyPath == "/var/lib/shelfsense/history.json");
    assert(settings.historyLimit == 40);
    assert(settings.performanceScope == domain::PerformanceScope::Global);
    assert(settings.alpha.base == 0.4 && settings.alpha.mlWeight == 0.5 && settings.alpha.max == 0.8);
    assert(settings.features.productPrefix == "Product_");
    assert(settings.features.humidityFeature == "Humidity_%");

    domain::KineticProfileCatalog catalog(settings.kineticProfiles);
    assert(catalog.size() == 6);
    assert(catalog.at("pear").referenceShelfLifeDays == 30.0);
    assert(catalog.at("pear").referenceTemperatureC == 5.0);
    assert(catalog.at("apple").referenceShelfLifeDays == 60.0);

    // A broken section keeps its defaults, the rest still applies.
    Write(path, R"({ "history_limit": 10, "alpha": { "base": "high" } })");
    settings = ConfigLoader::Load(path);
    assert(settings.historyLimit == 10);
    assert(settings.alpha.base == 0.35);

    // A retention window below one entry is rejected, not wrapped.
    Write(path, R"({ "history_limit": -1 })");
    settings = ConfigLoader::Load(path);
    assert(settings.historyLimit == 120);
    Write(path, R"({ "history_limit": 0, "history_path": "/tmp/h.json" })");
    settings = ConfigLoader::Load(path);
    assert(settings.historyLimit == 120);
    assert(settings.historyPath == "/tmp/h.json");

    // Malformed file: defaults.
    Write(path, "{ \"history_limit\": ");
    settings = ConfigLoader::Load(path);
    assert(settings.historyLimit == 120);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
