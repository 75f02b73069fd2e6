/**
 * @file ShelfSenseApp.hpp
 * @brief Command-line front end for the shelf-life engine.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "application/ShelfLifePredictor.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace shelfsense::app {

/**
 * @class ShelfSenseApp
 * @brief Parses a command, wires the predictor from settings and prints JSON.
 *
 * Commands: predict, summary, annotate, products.
 */
class ShelfSenseApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitRejected = 1;
    static constexpr int kExitUsage = 2;

    /**
     * @brief Runs one command.
     * @return Exit code (0 success, 1 rejected request, 2 usage error).
     */
    int Run(int argc, char** argv);

    /**
     * @brief Builds a predictor backed by the configured model and history file.
     * @throws std::runtime_error / domain::InvalidModelSchemaError if the model cannot be loaded.
     */
    static std::unique_ptr<application::ShelfLifePredictor> BuildPredictor(const infrastructure::PredictorSettings& settings);

private:
    using Options = std::map<std::string, std::string>;

    static bool ParseOptions(int argc, char** argv, int first, Options& out);
    static void PrintUsage();

    int RunPredict(const Options& opts, const infrastructure::PredictorSettings& settings);
    int RunSummary(const infrastructure::PredictorSettings& settings);
    int RunAnnotate(const Options& opts, const infrastructure::PredictorSettings& settings);
    int RunProducts(const infrastructure::PredictorSettings& settings);
};

} // namespace shelfsense::app
