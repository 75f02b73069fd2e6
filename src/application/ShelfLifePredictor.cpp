/**
 * @file ShelfLifePredictor.cpp
 * @brief Implementation of ShelfLifePredictor.
 */

#include "application/ShelfLifePredictor.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace shelfsense::application {

ShelfLifePredictor::ShelfLifePredictor(domain::KineticProfileCatalog catalog,
                                       std::shared_ptr<domain::PredictionHistoryRepository> history,
                                       RegressorAdapter regressor,
                                       domain::AlphaCalibrator calibrator,
                                       domain::ConfidenceAssessor assessor)
    : m_catalog(std::move(catalog)),
      m_history(std::move(history)),
      m_regressor(std::move(regressor)),
      m_calibrator(std::move(calibrator)),
      m_assessor(std::move(assessor)) {
    if (!m_history) {
        throw std::invalid_argument("ShelfLifePredictor: History repository cannot be null.");
    }
}

domain::ShelfLifeResult ShelfLifePredictor::predict(const PredictionRequest& request) {
    const std::string product = domain::NormalizeProductKey(request.productType);
    // Fail fast before either model sees the product.
    const domain::KineticProfile& profile = m_catalog.at(product);

    auto history = m_history->loadAll();
    double stability = m_assessor.assessSensorStability(request.readings, request.temperatureC, request.humidityPercent);
    double performance = m_assessor.assessModelPerformance(history, product);
    double alpha = m_calibrator.calibrate(stability, performance, request.alphaOverride);

    double arrhenius = m_kinetic.predictDays(profile, request.temperatureC, request.humidityPercent);
    double ml = m_regressor.predictDays(product, request.temperatureC, request.humidityPercent);
    double hybrid = alpha * arrhenius + (1.0 - alpha) * ml;

    domain::PredictionRecord record;
    record.product = product;
    record.batchId = request.batchId;
    record.temperatureC = request.temperatureC;
    record.humidityPercent = request.humidityPercent;
    record.mlPrediction = ml;
    record.arrheniusPrediction = arrhenius;
    record.hybridPrediction = hybrid;
    record.alphaUsed = alpha;
    record.sensorSamples = static_cast<int>(request.readings.size());
    record.recordedAt = std::chrono::system_clock::now();

    if (!m_history->append(record)) {
        std::cerr << "[ShelfLifePredictor] History entry for '" << product
                  << "' was not persisted; returning estimate anyway." << std::endl;
    }

    domain::ShelfLifeResult result;
    result.mlPrediction = ml;
    result.arrheniusPrediction = arrhenius;
    result.hybridPrediction = hybrid;
    result.alphaUsed = alpha;
    result.sensorTemperatureC = request.temperatureC;
    result.sensorHumidityPercent = request.humidityPercent;
    result.sensorSamples = record.sensorSamples;
    result.sensorStability = stability;
    result.mlPerformance = performance;
    return result;
}

HistorySummary ShelfLifePredictor::summarizeHistory() {
    HistorySummary summary;
    auto history = m_history->loadAll();
    summary.entries = history.size();
    if (history.empty()) return summary;

    std::size_t start = history.size() > kSummaryWindow ? history.size() - kSummaryWindow : 0;
    double alphaSum = 0.0, mlSum = 0.0;
    for (std::size_t i = start; i < history.size(); ++i) {
        alphaSum += history[i].alphaUsed;
        mlSum += history[i].mlPrediction;
    }
    double n = static_cast<double>(history.size() - start);
    summary.recentAlpha = alphaSum / n;
    summary.recentMlPrediction = mlSum / n;
    return summary;
}

bool ShelfLifePredictor::recordObservedShelfLife(const std::string& batchId, double actualDays) {
    if (!domain::IsValidObservedShelfLife(actualDays)) {
        throw std::invalid_argument("ShelfLifePredictor: Observed shelf life must be a finite positive number of days.");
    }
    return m_history->annotateObservedShelfLife(batchId, actualDays);
}

} // namespace shelfsense::application
