/**
 * @file ConfidenceAssessor.cpp
 * @brief Implementation of ConfidenceAssessor.
 */

#include "domain/ConfidenceAssessor.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace shelfsense::domain {

namespace {

constexpr double kEpsilon = 1e-6;

double Mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Population standard deviation over mean magnitude.
double CoefficientOfVariation(const std::vector<double>& values) {
    double mean = Mean(values);
    double sq = 0.0;
    for (double v : values) {
        sq += (v - mean) * (v - mean);
    }
    double stddev = std::sqrt(sq / static_cast<double>(values.size()));
    return stddev / (std::abs(mean) + kEpsilon);
}

} // namespace

ConfidenceAssessor::ConfidenceAssessor(PerformanceScope scope) : m_scope(scope) {}

double ConfidenceAssessor::assessSensorStability(const std::vector<EnvironmentalReading>& readings,
                                                 double fallbackTemperatureC,
                                                 double fallbackHumidityPercent) const {
    if (readings.empty()) return kNeutralScore;
    if (readings.size() < 2) return kSingleReadingScore;

    std::vector<double> temps;
    std::vector<double> hums;
    temps.reserve(readings.size());
    hums.reserve(readings.size());
    for (const auto& r : readings) {
        temps.push_back(r.temperatureC.value_or(fallbackTemperatureC));
        hums.push_back(r.humidityPercent.value_or(fallbackHumidityPercent));
    }

    double tempScore = std::max(0.0, 1.0 - CoefficientOfVariation(temps) * kTemperatureCvPenalty);
    double humScore = std::max(0.0, 1.0 - CoefficientOfVariation(hums) * kHumidityCvPenalty);
    return std::clamp((tempScore + humScore) / 2.0, 0.0, 1.0);
}

double ConfidenceAssessor::assessModelPerformance(const std::vector<PredictionRecord>& history,
                                                  const std::string& productKey) const {
    if (history.empty()) return kNeutralScore;

    // 1. Accuracy against observed outcomes
    std::vector<const PredictionRecord*> validated;
    for (const auto& entry : history) {
        if (entry.isValidated()) validated.push_back(&entry);
    }
    if (!validated.empty()) {
        std::size_t start = validated.size() > kValidatedWindow ? validated.size() - kValidatedWindow : 0;
        std::vector<double> scores;
        for (std::size_t i = start; i < validated.size(); ++i) {
            double actual = *validated[i]->actualShelfLifeDays;
            double predicted = validated[i]->hybridPrediction;
            if (predicted <= 0.0) continue;
            double error = std::abs(actual - predicted) / std::max(actual, kEpsilon);
            scores.push_back(std::max(0.0, 1.0 - error));
        }
        if (!scores.empty()) {
            return Mean(scores);
        }
    }

    // 2. Self-consistency of recent regressor output
    std::vector<double> preds;
    for (auto it = history.rbegin(); it != history.rend() && preds.size() < kConsistencyWindow; ++it) {
        if (m_scope == PerformanceScope::PerProduct && it->product != productKey) continue;
        preds.push_back(it->mlPrediction);
    }
    if (preds.size() > 1) {
        return std::clamp(1.0 - CoefficientOfVariation(preds), 0.0, 1.0);
    }
    return kNeutralScore;
}

} // namespace shelfsense::domain
