/**
 * @file RegressionModel.hpp
 * @brief Capability interface for a pre-trained shelf-life regressor.
 */

#pragma once
#include <string>
#include <vector>

namespace shelfsense::domain {

/**
 * @class RegressionModel
 * @brief A trained model that declares the ordered features it expects.
 *
 * Implementations expose their own schema so that callers can build input
 * vectors without hard-coding the feature layout.
 */
class RegressionModel {
public:
    virtual ~RegressionModel() = default;

    /**
     * @brief Ordered feature names the model was trained on.
     * @return Empty if the model carries no schema metadata.
     */
    virtual const std::vector<std::string>& featureNames() const = 0;

    /**
     * @brief Evaluates the model on one row.
     * @param features Values in featureNames() order.
     * @return Predicted shelf life in days.
     */
    virtual double predict(const std::vector<double>& features) const = 0;
};

} // namespace shelfsense::domain
