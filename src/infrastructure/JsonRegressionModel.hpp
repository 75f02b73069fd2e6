/**
 * @file JsonRegressionModel.hpp
 * @brief Pre-trained regressor exported to JSON (linear or random forest).
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/RegressionModel.hpp"

namespace shelfsense::infrastructure {

struct RegressionNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    double value = 0.0;

    bool isLeaf() const { return left < 0 && right < 0; }
};

struct RegressionTree {
    std::vector<RegressionNode> nodes;
};

/**
 * @class JsonRegressionModel
 * @brief Evaluates a model exported from the training pipeline.
 *
 * File layout:
 * @code
 * { "feature_names_in": ["Temperature_C", "Humidity_%", "Type_Apple", ...],
 *   "estimator": "linear", "intercept": 40.0, "coefficients": [...] }
 * { "feature_names_in": [...],
 *   "estimator": "random_forest",
 *   "trees": [ { "nodes": [ { "feature": 0, "threshold": 8.5, "left": 1, "right": 2, "value": 0 }, ... ] } ] }
 * @endcode
 * Forest leaves (left and right < 0) hold the prediction; trees are averaged.
 */
class JsonRegressionModel : public domain::RegressionModel {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    enum class Estimator { Linear, RandomForest };

    /// Only reachable through FromJson/LoadFromFile.
    explicit JsonRegressionModel(ConstructionKey) {}

    /**
     * @brief Builds a model from parsed JSON.
     * @throws domain::InvalidModelSchemaError on missing feature metadata or inconsistent estimator data.
     */
    static std::shared_ptr<JsonRegressionModel> FromJson(const nlohmann::json& j);

    /**
     * @brief Loads a model file.
     * @throws std::runtime_error if the file is missing or not JSON.
     */
    static std::shared_ptr<JsonRegressionModel> LoadFromFile(const std::string& path);

    const std::vector<std::string>& featureNames() const override { return m_featureNames; }
    double predict(const std::vector<double>& features) const override;

    Estimator estimator() const { return m_estimator; }

private:
    double evaluateTree(const RegressionTree& tree, const std::vector<double>& x) const;

    std::vector<std::string> m_featureNames;
    Estimator m_estimator = Estimator::Linear;
    double m_intercept = 0.0;
    std::vector<double> m_coefficients;
    std::vector<RegressionTree> m_trees;
};

} // namespace shelfsense::infrastructure
