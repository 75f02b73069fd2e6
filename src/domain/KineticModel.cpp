/**
 * @file KineticModel.cpp
 * @brief Implementation of KineticModel.
 */

#include "domain/KineticModel.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace shelfsense::domain {

double KineticModel::RateConstant(double activationEnergy, double preExponentialFactor, double temperatureK) {
    return preExponentialFactor * std::exp(-activationEnergy / (kGasConstant * temperatureK));
}

double KineticModel::HumidityFactor(double humidityPercent) {
    double rh = std::clamp(humidityPercent, kMinHumidity, kMaxHumidity);
    double deviation = std::abs(rh - kOptimalHumidity);
    return std::exp(-kHumidityPenaltyRate * std::pow(deviation, kHumidityPenaltyExponent));
}

double KineticModel::predictDays(const KineticProfile& profile, double temperatureC, double humidityPercent) const {
    if (!std::isfinite(temperatureC) || !std::isfinite(humidityPercent)) {
        throw std::invalid_argument("KineticModel: Temperature and humidity must be finite.");
    }

    double inputK = temperatureC + kKelvinOffset;
    double referenceK = profile.referenceTemperatureC + kKelvinOffset;
    if (inputK <= 0.0) {
        throw std::invalid_argument("KineticModel: Temperature is at or below absolute zero.");
    }

    // k_ref / k_input; A cancels, so take the exponent difference directly.
    double ratio = std::exp(profile.activationEnergy / kGasConstant * (1.0 / inputK - 1.0 / referenceK));

    return profile.referenceShelfLifeDays * ratio * HumidityFactor(humidityPercent);
}

} // namespace shelfsense::domain
