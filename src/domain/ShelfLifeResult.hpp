/**
 * @file ShelfLifeResult.hpp
 * @brief Output bundle returned by the predictor.
 */

#pragma once

namespace shelfsense::domain {

struct ShelfLifeResult {
    double mlPrediction = 0.0;
    double arrheniusPrediction = 0.0;
    double hybridPrediction = 0.0;
    double alphaUsed = 0.0;
    double sensorTemperatureC = 0.0;
    double sensorHumidityPercent = 0.0;
    int sensorSamples = 0;
    double sensorStability = 0.0;  ///< Diagnostic.
    double mlPerformance = 0.0;    ///< Diagnostic.
};

} // namespace shelfsense::domain
