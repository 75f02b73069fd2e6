/**
 * @file ShelfLifePredictor.hpp
 * @brief Façade combining the kinetic model and the learned regressor.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/RegressorAdapter.hpp"
#include "domain/AlphaCalibrator.hpp"
#include "domain/ConfidenceAssessor.hpp"
#include "domain/EnvironmentalReading.hpp"
#include "domain/KineticModel.hpp"
#include "domain/KineticProfile.hpp"
#include "domain/PredictionHistoryRepository.hpp"
#include "domain/ShelfLifeResult.hpp"

namespace shelfsense::application {

/**
 * @struct PredictionRequest
 * @brief Product and resolved environmental context for one prediction.
 */
struct PredictionRequest {
    std::string productType;                              ///< Free text, case-insensitive.
    double temperatureC = 0.0;
    double humidityPercent = 0.0;
    std::vector<domain::EnvironmentalReading> readings;   ///< Raw recent samples, may be empty.
    std::optional<double> alphaOverride;
    std::optional<std::string> batchId;
};

/**
 * @struct HistorySummary
 * @brief Aggregate over the most recent history entries.
 */
struct HistorySummary {
    std::size_t entries = 0;
    std::optional<double> recentAlpha;
    std::optional<double> recentMlPrediction;
};

/**
 * @class ShelfLifePredictor
 * @brief Runs one self-contained prediction transaction per call.
 *
 * load history -> assess stability -> assess performance -> calibrate alpha
 * -> kinetic -> regressor -> blend -> append history.
 * Nothing is written unless both sub-predictions succeed.
 */
class ShelfLifePredictor {
public:
    static constexpr std::size_t kSummaryWindow = 10;

    ShelfLifePredictor(domain::KineticProfileCatalog catalog,
                       std::shared_ptr<domain::PredictionHistoryRepository> history,
                       RegressorAdapter regressor,
                       domain::AlphaCalibrator calibrator = domain::AlphaCalibrator{},
                       domain::ConfidenceAssessor assessor = domain::ConfidenceAssessor{});

    /**
     * @brief Estimates remaining shelf life and records the call in history.
     * @throws domain::UnsupportedProductError if the product has no kinetic profile.
     * @throws domain::InvalidModelSchemaError if the regressor schema is unusable.
     */
    domain::ShelfLifeResult predict(const PredictionRequest& request);

    /** @brief Average alpha and regressor output over the last few entries. */
    HistorySummary summarizeHistory();

    /**
     * @brief Feeds an observed outcome back for accuracy scoring.
     * @return false if no un-annotated entry exists for the batch.
     * @throws std::invalid_argument if actualDays is not positive.
     */
    bool recordObservedShelfLife(const std::string& batchId, double actualDays);

    std::vector<std::string> supportedProducts() const { return m_catalog.products(); }

private:
    domain::KineticProfileCatalog m_catalog;
    std::shared_ptr<domain::PredictionHistoryRepository> m_history;
    RegressorAdapter m_regressor;
    domain::AlphaCalibrator m_calibrator;
    domain::ConfidenceAssessor m_assessor;
    domain::KineticModel m_kinetic;
};

} // namespace shelfsense::application
