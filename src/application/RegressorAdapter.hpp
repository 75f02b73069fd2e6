/**
 * @file RegressorAdapter.hpp
 * @brief Builds model-ordered feature vectors and extracts day-count predictions.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/RegressionModel.hpp"

namespace shelfsense::application {

/**
 * @struct FeatureBinding
 * @brief Names under which the trained model declares its inputs.
 */
struct FeatureBinding {
    std::string temperatureFeature = "Temperature_C";
    std::string humidityFeature = "Humidity_%";
    std::string productPrefix = "Type_";
};

/**
 * @class RegressorAdapter
 * @brief Adapts (product, temperature, humidity) to a pre-trained regressor.
 *
 * The feature layout is read from the model's declared schema on every call,
 * so a retrained model with a different column set stays in sync.
 */
class RegressorAdapter {
public:
    RegressorAdapter(std::shared_ptr<const domain::RegressionModel> model, FeatureBinding binding = FeatureBinding{});

    /**
     * @brief Encodes the inputs in the model's feature order.
     *
     * Numeric columns get the raw values, one-hot product columns get 1 for the
     * matching product, every other column gets 0.
     * @throws domain::InvalidModelSchemaError if the schema is missing or lacks a numeric feature.
     */
    std::vector<double> encode(const std::string& productKey, double temperatureC, double humidityPercent) const;

    /** @brief Predicted shelf life in days, floored at zero. */
    double predictDays(const std::string& productKey, double temperatureC, double humidityPercent) const;

    /** @brief One-hot column name for a product ("apple" -> "Type_Apple"). */
    std::string productColumn(const std::string& productKey) const;

private:
    std::shared_ptr<const domain::RegressionModel> m_model;
    FeatureBinding m_binding;
};

} // namespace shelfsense::application
