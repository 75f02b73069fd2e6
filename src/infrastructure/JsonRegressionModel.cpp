/**
 * @file JsonRegressionModel.cpp
 * @brief Implementation of JsonRegressionModel.
 */

#include "infrastructure/JsonRegressionModel.hpp"
#include "domain/ShelfLifeErrors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace shelfsense::infrastructure {

using json = nlohmann::json;

namespace {

RegressionTree ParseTree(const json& jt, int featureCount) {
    if (!jt.contains("nodes") || !jt["nodes"].is_array() || jt["nodes"].empty()) {
        throw domain::InvalidModelSchemaError("tree without nodes");
    }
    RegressionTree tree;
    const int n = static_cast<int>(jt["nodes"].size());
    for (const auto& jn : jt["nodes"]) {
        RegressionNode node;
        node.feature = jn.value("feature", -1);
        node.threshold = jn.value("threshold", 0.0);
        node.left = jn.value("left", -1);
        node.right = jn.value("right", -1);
        node.value = jn.value("value", 0.0);

        if (!node.isLeaf()) {
            if (node.feature < 0 || node.feature >= featureCount) {
                throw domain::InvalidModelSchemaError("split on undeclared feature index " + std::to_string(node.feature));
            }
            if (node.left < 0 || node.left >= n || node.right < 0 || node.right >= n) {
                throw domain::InvalidModelSchemaError("child index out of range");
            }
        }
        tree.nodes.push_back(node);
    }
    return tree;
}

} // namespace

std::shared_ptr<JsonRegressionModel> JsonRegressionModel::FromJson(const json& j) {
    if (!j.is_object() || !j.contains("feature_names_in") || !j["feature_names_in"].is_array()) {
        throw domain::InvalidModelSchemaError("loaded model is missing feature metadata");
    }

    auto model = std::make_shared<JsonRegressionModel>(ConstructionKey{});
    try {
        model->m_featureNames = j["feature_names_in"].get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw domain::InvalidModelSchemaError(std::string("feature names are not strings: ") + e.what());
    }
    if (model->m_featureNames.empty()) {
        throw domain::InvalidModelSchemaError("loaded model declares no features");
    }

    const int featureCount = static_cast<int>(model->m_featureNames.size());
    std::string estimator = j.value("estimator", std::string("linear"));

    try {
        if (estimator == "linear") {
            model->m_estimator = Estimator::Linear;
            model->m_intercept = j.value("intercept", 0.0);
            model->m_coefficients = j.at("coefficients").get<std::vector<double>>();
            if (static_cast<int>(model->m_coefficients.size()) != featureCount) {
                throw domain::InvalidModelSchemaError("coefficient count does not match feature count");
            }
        } else if (estimator == "random_forest") {
            model->m_estimator = Estimator::RandomForest;
            const auto& trees = j.at("trees");
            if (!trees.is_array() || trees.empty()) {
                throw domain::InvalidModelSchemaError("random forest without trees");
            }
            for (const auto& jt : trees) {
                model->m_trees.push_back(ParseTree(jt, featureCount));
            }
        } else {
            throw domain::InvalidModelSchemaError("unknown estimator '" + estimator + "'");
        }
    } catch (const json::exception& e) {
        throw domain::InvalidModelSchemaError(std::string("malformed estimator data: ") + e.what());
    }

    return model;
}

std::shared_ptr<JsonRegressionModel> JsonRegressionModel::LoadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Shelf life model missing at " + path);
    }
    std::cerr << "[JsonRegressionModel] Loading shelf-life model from " << path << std::endl;

    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open shelf life model at " + path);
    }
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Shelf life model at " + path + " is not valid JSON: " + e.what());
    }
    return FromJson(j);
}

double JsonRegressionModel::evaluateTree(const RegressionTree& tree, const std::vector<double>& x) const {
    std::size_t i = 0;
    // A well-formed tree reaches a leaf in fewer steps than it has nodes.
    for (std::size_t steps = 0; steps <= tree.nodes.size(); ++steps) {
        const auto& node = tree.nodes[i];
        if (node.isLeaf()) return node.value;
        i = static_cast<std::size_t>(x[node.feature] <= node.threshold ? node.left : node.right);
    }
    throw std::runtime_error("JsonRegressionModel: Tree contains a cycle.");
}

double JsonRegressionModel::predict(const std::vector<double>& features) const {
    if (features.size() != m_featureNames.size()) {
        throw std::invalid_argument("JsonRegressionModel: Expected " + std::to_string(m_featureNames.size()) +
                                    " features, got " + std::to_string(features.size()));
    }

    if (m_estimator == Estimator::Linear) {
        double y = m_intercept;
        for (std::size_t k = 0; k < features.size(); ++k) {
            y += m_coefficients[k] * features[k];
        }
        return y;
    }

    double sum = 0.0;
    for (const auto& tree : m_trees) {
        sum += evaluateTree(tree, features);
    }
    return sum / static_cast<double>(m_trees.size());
}

} // namespace shelfsense::infrastructure
