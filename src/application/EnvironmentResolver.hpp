/**
 * @file EnvironmentResolver.hpp
 * @brief Application service that turns telemetry and overrides into predictor inputs.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/EnvironmentalReading.hpp"

namespace shelfsense::application {

/**
 * @struct ResolvedEnvironment
 * @brief Averaged (or overridden) conditions plus the samples that informed them.
 */
struct ResolvedEnvironment {
    double temperatureC = 0.0;
    double humidityPercent = 0.0;
    std::vector<domain::EnvironmentalReading> readings; ///< Newest first.
};

class EnvironmentResolver {
public:
    static constexpr std::size_t kDefaultSampleLimit = 50;

    explicit EnvironmentResolver(std::size_t sampleLimit = kDefaultSampleLimit);

    /**
     * @brief Resolves temperature and humidity for a prediction.
     *
     * Keeps the newest sampleLimit readings. Each channel is the override when
     * given, otherwise the mean of the samples that carry it.
     * @throws domain::EnvironmentUnavailableError if a channel cannot be resolved.
     */
    ResolvedEnvironment resolve(std::vector<domain::EnvironmentalReading> readings,
                                std::optional<double> temperatureOverride,
                                std::optional<double> humidityOverride) const;

private:
    std::size_t m_sampleLimit;
};

} // namespace shelfsense::application
