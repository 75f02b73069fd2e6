/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading predictor configuration (settings.json).
 *
 * Provides a unified way to access model/history locations and calibration
 * constants without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include "application/RegressorAdapter.hpp"
#include "domain/AlphaCalibrator.hpp"
#include "domain/ConfidenceAssessor.hpp"
#include "domain/KineticProfile.hpp"

namespace shelfsense::infrastructure {

struct PredictorSettings {
    std::string modelPath;
    std::string historyPath;
    std::size_t historyLimit = 120;
    domain::PerformanceScope performanceScope = domain::PerformanceScope::PerProduct;
    domain::AlphaPolicy alpha;
    application::FeatureBinding features;
    std::map<std::string, domain::KineticProfile> kineticProfiles; ///< Built-ins merged with configured extras.
};

class ConfigLoader {
public:
    /**
     * @brief Defaults: built-in kinetic table, XDG data paths, stock alpha policy.
     */
    static PredictorSettings Defaults();

    /**
     * @brief Reads settings.json, overlaying present keys on Defaults().
     * @param settingsPath Path to the file. A missing file yields the defaults.
     *
     * A malformed file is reported on stderr and the defaults are returned.
     * Individual sections with the wrong type keep their default.
     */
    static PredictorSettings Load(const std::string& settingsPath);
};

} // namespace shelfsense::infrastructure
