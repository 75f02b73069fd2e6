/**
 * @file AlphaCalibrator.cpp
 * @brief Implementation of AlphaCalibrator.
 */

#include "domain/AlphaCalibrator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace shelfsense::domain {

AlphaCalibrator::AlphaCalibrator(AlphaPolicy policy) : m_policy(policy) {
    if (!(m_policy.min >= 0.0 && m_policy.min <= m_policy.max && m_policy.max <= 1.0)) {
        throw std::invalid_argument("AlphaPolicy: Bounds must satisfy 0 <= min <= max <= 1.");
    }
    if (!(m_policy.sensorWeight >= 0.0) || !(m_policy.mlWeight >= 0.0)) {
        throw std::invalid_argument("AlphaPolicy: Weights cannot be negative.");
    }
    if (!std::isfinite(m_policy.base)) {
        throw std::invalid_argument("AlphaPolicy: Base weight must be finite.");
    }
}

double AlphaCalibrator::calibrate(double sensorStability, double mlPerformance,
                                  std::optional<double> override) const {
    if (override) {
        if (std::isfinite(*override)) {
            return std::clamp(*override, 0.0, 1.0);
        }
        std::cerr << "[AlphaCalibrator] Ignoring non-finite alpha override." << std::endl;
    }

    double alpha = m_policy.base;
    alpha += (sensorStability - 0.5) * m_policy.sensorWeight;
    alpha -= (mlPerformance - 0.5) * m_policy.mlWeight;
    return std::clamp(alpha, m_policy.min, m_policy.max);
}

} // namespace shelfsense::domain
