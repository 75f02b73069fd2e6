/**
 * @file AlphaCalibrator.hpp
 * @brief Maps confidence scores to the weight given to the kinetic model.
 */

#pragma once
#include <optional>

namespace shelfsense::domain {

/**
 * @struct AlphaPolicy
 * @brief Fixed calibration constants.
 *
 * mlWeight exceeds sensorWeight: a validated regressor is stronger evidence
 * than a calm sensor window.
 */
struct AlphaPolicy {
    double base = 0.35;
    double min = 0.1;
    double max = 0.8;
    double sensorWeight = 0.30;
    double mlWeight = 0.40;
};

/**
 * @class AlphaCalibrator
 * @brief Computes alpha, the kinetic share of the hybrid estimate.
 *
 * The regressor receives 1 - alpha.
 */
class AlphaCalibrator {
public:
    /** @throws std::invalid_argument if the bounds or weights are inconsistent. */
    explicit AlphaCalibrator(AlphaPolicy policy = AlphaPolicy{});

    /**
     * @brief Blends the two scores into alpha within [policy.min, policy.max].
     * @param override If set and finite, bypasses calibration and is clamped to [0, 1].
     */
    double calibrate(double sensorStability, double mlPerformance,
                     std::optional<double> override = std::nullopt) const;

    const AlphaPolicy& policy() const { return m_policy; }

private:
    AlphaPolicy m_policy;
};

} // namespace shelfsense::domain
