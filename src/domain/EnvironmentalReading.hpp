/**
 * @file EnvironmentalReading.hpp
 * @brief A single temperature/humidity sample from batch telemetry.
 */

#pragma once
#include <chrono>
#include <optional>

namespace shelfsense::domain {

/**
 * @struct EnvironmentalReading
 * @brief Ephemeral sample used for stability assessment and context resolution.
 *
 * Either channel may be missing when a sensor dropped a value.
 */
struct EnvironmentalReading {
    std::optional<double> temperatureC;
    std::optional<double> humidityPercent;
    std::chrono::system_clock::time_point capturedAt;
};

} // namespace shelfsense::domain
