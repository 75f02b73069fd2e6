/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace shelfsense::infrastructure {

using json = nlohmann::json;

namespace {

void ReadAlpha(const json& j, domain::AlphaPolicy& alpha) {
    alpha.base = j.value("base", alpha.base);
    alpha.min = j.value("min", alpha.min);
    alpha.max = j.value("max", alpha.max);
    alpha.sensorWeight = j.value("sensor_weight", alpha.sensorWeight);
    alpha.mlWeight = j.value("ml_weight", alpha.mlWeight);
}

void ReadFeatures(const json& j, application::FeatureBinding& features) {
    features.temperatureFeature = j.value("temperature", features.temperatureFeature);
    features.humidityFeature = j.value("humidity", features.humidityFeature);
    features.productPrefix = j.value("product_prefix", features.productPrefix);
}

void ReadProfiles(const json& j, std::map<std::string, domain::KineticProfile>& profiles) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& p = it.value();
        domain::KineticProfile profile;
        profile.activationEnergy = p.at("activation_energy").get<double>();
        profile.preExponentialFactor = p.at("pre_exponential_factor").get<double>();
        profile.referenceShelfLifeDays = p.at("reference_shelf_life_days").get<double>();
        profile.referenceTemperatureC = p.value("reference_temperature_c", profile.referenceTemperatureC);
        profiles[domain::NormalizeProductKey(it.key())] = profile;
    }
}

} // namespace

PredictorSettings ConfigLoader::Defaults() {
    PredictorSettings settings;
    settings.modelPath = PathUtils::DefaultModelPath().string();
    settings.historyPath = PathUtils::DefaultHistoryPath().string();
    settings.kineticProfiles = domain::KineticProfileCatalog::BuiltInProfiles();
    return settings;
}

PredictorSettings ConfigLoader::Load(const std::string& settingsPath) {
    PredictorSettings settings = Defaults();
    if (!std::filesystem::exists(settingsPath)) {
        return settings;
    }

    json j;
    try {
        std::ifstream f(settingsPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << settingsPath << " is not a JSON object, using defaults." << std::endl;
        return settings;
    }

    try {
        settings.modelPath = j.value("model_path", settings.modelPath);
        settings.historyPath = j.value("history_path", settings.historyPath);
        if (j.contains("history_limit")) {
            long long limit = j["history_limit"].get<long long>();
            if (limit >= 1) {
                settings.historyLimit = static_cast<std::size_t>(limit);
            } else {
                std::cerr << "[ConfigLoader] history_limit must be at least 1, got " << limit
                          << "; keeping " << settings.historyLimit << "." << std::endl;
            }
        }
        if (j.contains("performance_scope")) {
            std::string scope = j["performance_scope"].get<std::string>();
            if (scope == "global") {
                settings.performanceScope = domain::PerformanceScope::Global;
            } else if (scope == "product") {
                settings.performanceScope = domain::PerformanceScope::PerProduct;
            } else {
                std::cerr << "[ConfigLoader] Unknown performance_scope '" << scope << "', keeping 'product'." << std::endl;
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid path/limit settings: " << e.what() << std::endl;
    }

    if (j.contains("alpha") && j["alpha"].is_object()) {
        domain::AlphaPolicy alpha = settings.alpha;
        try {
            ReadAlpha(j["alpha"], alpha);
            settings.alpha = alpha;
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Invalid alpha section: " << e.what() << std::endl;
        }
    }

    if (j.contains("features") && j["features"].is_object()) {
        application::FeatureBinding features = settings.features;
        try {
            ReadFeatures(j["features"], features);
            settings.features = features;
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Invalid features section: " << e.what() << std::endl;
        }
    }

    if (j.contains("kinetic_profiles") && j["kinetic_profiles"].is_object()) {
        auto profiles = settings.kineticProfiles;
        try {
            ReadProfiles(j["kinetic_profiles"], profiles);
            settings.kineticProfiles = profiles;
        } catch (const json::exception& e) {
            std::cerr << "[ConfigLoader] Invalid kinetic_profiles section: " << e.what() << std::endl;
        }
    }

    return settings;
}

} // namespace shelfsense::infrastructure
