/**
 * @file EnvironmentResolver.cpp
 * @brief Implementation of EnvironmentResolver.
 */

#include "application/EnvironmentResolver.hpp"
#include "domain/ShelfLifeErrors.hpp"
#include <algorithm>

namespace shelfsense::application {

EnvironmentResolver::EnvironmentResolver(std::size_t sampleLimit) : m_sampleLimit(sampleLimit) {}

ResolvedEnvironment EnvironmentResolver::resolve(std::vector<domain::EnvironmentalReading> readings,
                                                 std::optional<double> temperatureOverride,
                                                 std::optional<double> humidityOverride) const {
    std::stable_sort(readings.begin(), readings.end(),
                     [](const domain::EnvironmentalReading& a, const domain::EnvironmentalReading& b) {
                         return a.capturedAt > b.capturedAt;
                     });
    if (readings.size() > m_sampleLimit) {
        readings.resize(m_sampleLimit);
    }

    double tempSum = 0.0, humSum = 0.0;
    int tempCount = 0, humCount = 0;
    for (const auto& r : readings) {
        if (r.temperatureC) { tempSum += *r.temperatureC; ++tempCount; }
        if (r.humidityPercent) { humSum += *r.humidityPercent; ++humCount; }
    }

    std::optional<double> temperature = temperatureOverride;
    if (!temperature && tempCount > 0) temperature = tempSum / tempCount;
    std::optional<double> humidity = humidityOverride;
    if (!humidity && humCount > 0) humidity = humSum / humCount;

    if (!temperature || !humidity) {
        throw domain::EnvironmentUnavailableError(
            "No temperature/humidity data is available for this batch. Provide overrides or ingest sensor data first.");
    }

    ResolvedEnvironment env;
    env.temperatureC = *temperature;
    env.humidityPercent = *humidity;
    env.readings = std::move(readings);
    return env;
}

} // namespace shelfsense::application
