/**
 * @file PredictionRecord.hpp
 * @brief History entry written once per successful prediction.
 */

#pragma once
#include <chrono>
#include <cmath>
#include <optional>
#include <string>

namespace shelfsense::domain {

/**
 * @struct PredictionRecord
 * @brief Inputs and outputs of one predictor invocation.
 */
struct PredictionRecord {
    std::string product;                 ///< Normalized product key.
    std::optional<std::string> batchId;  ///< Traceability only.
    double temperatureC = 0.0;
    double humidityPercent = 0.0;
    double mlPrediction = 0.0;
    double arrheniusPrediction = 0.0;
    double hybridPrediction = 0.0;
    double alphaUsed = 0.0;
    int sensorSamples = 0;
    std::chrono::system_clock::time_point recordedAt;

    /// Observed shelf life supplied later by external curation.
    std::optional<double> actualShelfLifeDays;

    bool isValidated() const { return actualShelfLifeDays.has_value() && *actualShelfLifeDays > 0.0; }
};

/// An observed shelf life must be a finite, strictly positive number of days.
inline bool IsValidObservedShelfLife(double days) {
    return std::isfinite(days) && days > 0.0;
}

} // namespace shelfsense::domain
