/**
 * @file RegressorAdapter.cpp
 * @brief Implementation of RegressorAdapter.
 */

#include "application/RegressorAdapter.hpp"
#include "domain/ShelfLifeErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace shelfsense::application {

RegressorAdapter::RegressorAdapter(std::shared_ptr<const domain::RegressionModel> model, FeatureBinding binding)
    : m_model(std::move(model)), m_binding(std::move(binding)) {
    if (!m_model) {
        throw std::invalid_argument("RegressorAdapter: Model cannot be null.");
    }
}

std::string RegressorAdapter::productColumn(const std::string& productKey) const {
    std::string name = productKey;
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return m_binding.productPrefix + name;
}

std::vector<double> RegressorAdapter::encode(const std::string& productKey, double temperatureC, double humidityPercent) const {
    const auto& columns = m_model->featureNames();
    if (columns.empty()) {
        throw domain::InvalidModelSchemaError("model declares no feature names");
    }
    if (std::find(columns.begin(), columns.end(), m_binding.temperatureFeature) == columns.end()) {
        throw domain::InvalidModelSchemaError("missing feature '" + m_binding.temperatureFeature + "'");
    }
    if (std::find(columns.begin(), columns.end(), m_binding.humidityFeature) == columns.end()) {
        throw domain::InvalidModelSchemaError("missing feature '" + m_binding.humidityFeature + "'");
    }

    const std::string oneHot = productColumn(productKey);
    std::vector<double> row;
    row.reserve(columns.size());
    for (const auto& column : columns) {
        if (column == m_binding.temperatureFeature) {
            row.push_back(temperatureC);
        } else if (column == m_binding.humidityFeature) {
            row.push_back(humidityPercent);
        } else if (column == oneHot) {
            row.push_back(1.0);
        } else {
            row.push_back(0.0);
        }
    }
    return row;
}

double RegressorAdapter::predictDays(const std::string& productKey, double temperatureC, double humidityPercent) const {
    double prediction = m_model->predict(encode(productKey, temperatureC, humidityPercent));
    if (!std::isfinite(prediction)) {
        throw std::runtime_error("RegressorAdapter: Model produced a non-finite prediction.");
    }
    return std::max(0.0, prediction);
}

} // namespace shelfsense::application
