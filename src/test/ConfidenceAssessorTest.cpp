#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "domain/ConfidenceAssessor.hpp"

using namespace shelfsense::domain;

static EnvironmentalReading Reading(double t, double h) {
    EnvironmentalReading r;
    r.temperatureC = t;
    r.humidityPercent = h;
    return r;
}

static PredictionRecord Record(const std::string& product, double ml, double hybrid,
                               std::optional<double> actual = std::nullopt) {
    PredictionRecord r;
    r.product = product;
    r.mlPrediction = ml;
    r.hybridPrediction = hybrid;
    r.actualShelfLifeDays = actual;
    return r;
}

static bool Near(double a, double b) { return std::abs(a - b) < 1e-9; }

int main() {
    std::cout << "[Test] Starting ConfidenceAssessor Test..." << std::endl;

    ConfidenceAssessor assessor;

    // --- Sensor stability ---
    assert(assessor.assessSensorStability({}, 5.0, 90.0) == 0.5);
    assert(assessor.assessSensorStability({Reading(5.0, 90.0)}, 5.0, 90.0) == 0.6);

    std::vector<EnvironmentalReading> identical(8, Reading(6.0, 88.0));
    assert(Near(assessor.assessSensorStability(identical, 6.0, 88.0), 1.0));

    // Increasing noise amplitude lowers the score.
    double previous = 1.0;
    for (double amplitude : {0.05, 0.1, 0.2, 0.4, 0.8}) {
        std::vector<EnvironmentalReading> noisy;
        for (int i = 0; i < 10; ++i) {
            double sign = (i % 2 == 0) ? 1.0 : -1.0;
            noisy.push_back(Reading(6.0 + sign * amplitude, 88.0 + sign * amplitude * 4.0));
        }
        double score = assessor.assessSensorStability(noisy, 6.0, 88.0);
        assert(score < previous);
        assert(score >= 0.0 && score <= 1.0);
        previous = score;
    }

    // Wild swings bottom out at zero.
    std::vector<EnvironmentalReading> chaotic = {Reading(1.0, 40.0), Reading(30.0, 100.0), Reading(2.0, 35.0)};
    assert(assessor.assessSensorStability(chaotic, 5.0, 90.0) == 0.0);

    // Missing channels use the fallbacks.
    EnvironmentalReading gap;
    gap.temperatureC = 6.0;
    std::vector<EnvironmentalReading> withGap = {Reading(6.0, 88.0), gap};
    assert(Near(assessor.assessSensorStability(withGap, 6.0, 88.0), 1.0));

    // Sub-zero storage is still scored on spread, not on the sign of the mean.
    std::vector<EnvironmentalReading> frozen(5, Reading(-18.0, 90.0));
    assert(Near(assessor.assessSensorStability(frozen, -18.0, 90.0), 1.0));

    // --- ML performance ---
    assert(assessor.assessModelPerformance({}, "apple") == 0.5);

    // Validated tier: mean of max(0, 1 - |actual - predicted| / actual).
    std::vector<PredictionRecord> validated = {
        Record("apple", 50.0, 50.0, 50.0),   // 1.0
        Record("apple", 40.0, 40.0, 50.0),   // 0.8
        Record("banana", 10.0, 30.0, 10.0),  // 0.0 (error 200%)
        Record("apple", 45.0, 45.0),         // unvalidated, ignored
    };
    assert(Near(assessor.assessModelPerformance(validated, "apple"), (1.0 + 0.8 + 0.0) / 3.0));

    // Only the most recent 20 validated entries count.
    std::vector<PredictionRecord> many;
    for (int i = 0; i < 5; ++i) many.push_back(Record("apple", 10.0, 10.0, 100.0)); // 0.1 each
    for (int i = 0; i < 20; ++i) many.push_back(Record("apple", 60.0, 60.0, 60.0)); // 1.0 each
    assert(Near(assessor.assessModelPerformance(many, "apple"), 1.0));

    // Consistency tier: identical regressor output is fully consistent.
    std::vector<PredictionRecord> steady(6, Record("apple", 42.0, 40.0));
    assert(Near(assessor.assessModelPerformance(steady, "apple"), 1.0));

    // Per-product scope ignores other products' spread.
    std::vector<PredictionRecord> mixed;
    for (int i = 0; i < 5; ++i) {
        mixed.push_back(Record("apple", 60.0, 55.0));
        mixed.push_back(Record("banana", 12.0, 11.0));
    }
    assert(Near(assessor.assessModelPerformance(mixed, "apple"), 1.0));

    ConfidenceAssessor global(PerformanceScope::Global);
    double globalScore = global.assessModelPerformance(mixed, "apple");
    // mean 36, population stddev 24 -> 1 - 0.666...
    assert(std::abs(globalScore - (1.0 - 24.0 / (36.0 + 1e-6))) < 1e-9);

    // A single matching prediction cannot show consistency.
    std::vector<PredictionRecord> lone = {Record("banana", 12.0, 11.0), Record("apple", 60.0, 55.0)};
    assert(assessor.assessModelPerformance(lone, "apple") == 0.5);

    std::cout << "[PASS] ConfidenceAssessor Test." << std::endl;
    return 0;
}
