/**
 * @file ConfidenceAssessor.hpp
 * @brief Domain service scoring how much each sub-model can be trusted.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/EnvironmentalReading.hpp"
#include "domain/PredictionRecord.hpp"

namespace shelfsense::domain {

/**
 * @enum PerformanceScope
 * @brief Which history entries feed the self-consistency fallback.
 */
enum class PerformanceScope {
    PerProduct, ///< Only entries for the product being predicted.
    Global      ///< Every entry regardless of product.
};

/**
 * @class ConfidenceAssessor
 * @brief Produces the sensor-stability and ML-performance scores, both in [0, 1].
 */
class ConfidenceAssessor {
public:
    static constexpr double kNeutralScore = 0.5;
    static constexpr double kSingleReadingScore = 0.6;
    static constexpr double kTemperatureCvPenalty = 10.0;
    static constexpr double kHumidityCvPenalty = 5.0;
    static constexpr std::size_t kValidatedWindow = 20;
    static constexpr std::size_t kConsistencyWindow = 10;

    explicit ConfidenceAssessor(PerformanceScope scope = PerformanceScope::PerProduct);

    /**
     * @brief Scores the stability of recent telemetry; 1 means perfectly stable.
     * @param readings Recent samples, any order.
     * @param fallbackTemperatureC Used for samples missing a temperature.
     * @param fallbackHumidityPercent Used for samples missing a humidity.
     */
    double assessSensorStability(const std::vector<EnvironmentalReading>& readings,
                                 double fallbackTemperatureC,
                                 double fallbackHumidityPercent) const;

    /**
     * @brief Scores the regressor's track record.
     *
     * Uses accuracy against observed shelf lives when any entry carries one,
     * otherwise the consistency of the most recent regressor predictions.
     */
    double assessModelPerformance(const std::vector<PredictionRecord>& history,
                                  const std::string& productKey) const;

    PerformanceScope scope() const { return m_scope; }

private:
    PerformanceScope m_scope;
};

} // namespace shelfsense::domain
