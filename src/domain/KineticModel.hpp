/**
 * @file KineticModel.hpp
 * @brief Closed-form Arrhenius shelf-life model with a humidity penalty.
 */

#pragma once
#include "domain/KineticProfile.hpp"

namespace shelfsense::domain {

/**
 * @class KineticModel
 * @brief Scales a product's reference shelf life by the Arrhenius rate ratio.
 *
 * Warmer-than-reference storage shrinks the estimate, cooler storage extends it.
 * Humidity away from the optimum applies a mild decaying penalty.
 */
class KineticModel {
public:
    static constexpr double kGasConstant = 8.314;      ///< J/(mol*K)
    static constexpr double kKelvinOffset = 273.15;
    static constexpr double kOptimalHumidity = 90.0;   ///< %RH
    static constexpr double kMinHumidity = 30.0;
    static constexpr double kMaxHumidity = 100.0;
    static constexpr double kHumidityPenaltyRate = 0.02;
    static constexpr double kHumidityPenaltyExponent = 1.2;

    /** @brief Arrhenius rate constant k = A * exp(-Ea / (R * T)). */
    static double RateConstant(double activationEnergy, double preExponentialFactor, double temperatureK);

    /** @brief Multiplicative penalty in (0, 1] for deviation from the optimal humidity. */
    static double HumidityFactor(double humidityPercent);

    /**
     * @brief Shelf life in days for the given storage conditions.
     * @throws std::invalid_argument on non-finite input or a temperature at or below absolute zero.
     */
    double predictDays(const KineticProfile& profile, double temperatureC, double humidityPercent) const;
};

} // namespace shelfsense::domain
