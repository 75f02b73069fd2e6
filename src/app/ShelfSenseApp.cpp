/**
 * @file ShelfSenseApp.cpp
 * @brief Implementation of the ShelfSenseApp class.
 */
#include "app/ShelfSenseApp.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "application/EnvironmentResolver.hpp"
#include "application/RegressorAdapter.hpp"
#include "domain/ShelfLifeErrors.hpp"
#include "infrastructure/JsonRegressionModel.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PredictionHistoryStoreFs.hpp"
#include "infrastructure/PredictionJson.hpp"

namespace shelfsense::app {

using json = nlohmann::json;

namespace {

std::optional<std::string> Find(const std::map<std::string, std::string>& opts, const std::string& key) {
    auto it = opts.find(key);
    if (it == opts.end()) return std::nullopt;
    return it->second;
}

std::optional<double> FindNumber(const std::map<std::string, std::string>& opts, const std::string& key) {
    auto raw = Find(opts, key);
    if (!raw) return std::nullopt;
    std::size_t used = 0;
    double value = std::stod(*raw, &used);
    if (used != raw->size()) {
        throw std::invalid_argument("--" + key + " expects a number, got '" + *raw + "'");
    }
    return value;
}

} // namespace

std::unique_ptr<application::ShelfLifePredictor> ShelfSenseApp::BuildPredictor(const infrastructure::PredictorSettings& settings) {
    auto model = infrastructure::JsonRegressionModel::LoadFromFile(settings.modelPath);
    auto history = std::make_shared<infrastructure::PredictionHistoryStoreFs>(settings.historyPath, settings.historyLimit);

    return std::make_unique<application::ShelfLifePredictor>(
        domain::KineticProfileCatalog(settings.kineticProfiles),
        history,
        application::RegressorAdapter(model, settings.features),
        domain::AlphaCalibrator(settings.alpha),
        domain::ConfidenceAssessor(settings.performanceScope));
}

bool ShelfSenseApp::ParseOptions(int argc, char** argv, int first, Options& out) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() < 3) {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        out[arg.substr(2)] = argv[++i];
    }
    return true;
}

void ShelfSenseApp::PrintUsage() {
    std::cerr << "Usage:\n"
              << "  shelfsense predict --product P [--temperature C] [--humidity H] [--readings FILE]\n"
              << "                     [--alpha A] [--batch ID] [--settings FILE]\n"
              << "  shelfsense summary [--settings FILE]\n"
              << "  shelfsense annotate --batch ID --actual DAYS [--settings FILE]\n"
              << "  shelfsense products [--settings FILE]\n";
}

int ShelfSenseApp::Run(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    std::string command = argv[1];
    Options opts;
    if (!ParseOptions(argc, argv, 2, opts)) {
        PrintUsage();
        return kExitUsage;
    }

    std::string settingsPath = Find(opts, "settings").value_or(infrastructure::PathUtils::DefaultSettingsPath().string());
    infrastructure::PredictorSettings settings = infrastructure::ConfigLoader::Load(settingsPath);

    try {
        if (command == "predict") return RunPredict(opts, settings);
        if (command == "summary") return RunSummary(settings);
        if (command == "annotate") return RunAnnotate(opts, settings);
        if (command == "products") return RunProducts(settings);
    } catch (const domain::UnsupportedProductError& e) {
        std::cerr << "[ShelfSenseApp] Rejected: " << e.what() << std::endl;
        return kExitRejected;
    } catch (const domain::EnvironmentUnavailableError& e) {
        std::cerr << "[ShelfSenseApp] Rejected: " << e.what() << std::endl;
        return kExitRejected;
    } catch (const domain::InvalidModelSchemaError& e) {
        std::cerr << "[ShelfSenseApp] Misconfigured model: " << e.what() << std::endl;
        return kExitRejected;
    } catch (const std::exception& e) {
        std::cerr << "[ShelfSenseApp] Error: " << e.what() << std::endl;
        return kExitRejected;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}

int ShelfSenseApp::RunPredict(const Options& opts, const infrastructure::PredictorSettings& settings) {
    auto product = Find(opts, "product");
    if (!product) {
        std::cerr << "predict requires --product" << std::endl;
        return kExitUsage;
    }

    std::vector<domain::EnvironmentalReading> readings;
    if (auto readingsPath = Find(opts, "readings")) {
        std::ifstream f(*readingsPath);
        if (!f.is_open()) {
            throw std::runtime_error("Cannot open readings file " + *readingsPath);
        }
        readings = infrastructure::ReadingsFromJson(json::parse(f));
    }

    application::EnvironmentResolver resolver;
    auto env = resolver.resolve(std::move(readings), FindNumber(opts, "temperature"), FindNumber(opts, "humidity"));

    application::PredictionRequest request;
    request.productType = *product;
    request.temperatureC = env.temperatureC;
    request.humidityPercent = env.humidityPercent;
    request.readings = std::move(env.readings);
    request.alphaOverride = FindNumber(opts, "alpha");
    request.batchId = Find(opts, "batch");

    auto predictor = BuildPredictor(settings);
    auto result = predictor->predict(request);

    std::cout << infrastructure::ResultToJson(result, *product, request.batchId, request.readings).dump(2) << std::endl;
    return kExitOk;
}

int ShelfSenseApp::RunSummary(const infrastructure::PredictorSettings& settings) {
    auto predictor = BuildPredictor(settings);
    auto summary = predictor->summarizeHistory();

    json j;
    j["entries"] = summary.entries;
    if (summary.recentAlpha) j["recent_alpha"] = *summary.recentAlpha;
    if (summary.recentMlPrediction) j["recent_ml_prediction"] = *summary.recentMlPrediction;
    std::cout << j.dump(2) << std::endl;
    return kExitOk;
}

int ShelfSenseApp::RunAnnotate(const Options& opts, const infrastructure::PredictorSettings& settings) {
    auto batch = Find(opts, "batch");
    auto actual = FindNumber(opts, "actual");
    if (!batch || !actual) {
        std::cerr << "annotate requires --batch and --actual" << std::endl;
        return kExitUsage;
    }

    if (!domain::IsValidObservedShelfLife(*actual)) {
        std::cerr << "annotate expects --actual to be a finite number of days above zero" << std::endl;
        return kExitUsage;
    }

    // Annotation only touches history; no model is needed.
    infrastructure::PredictionHistoryStoreFs store(settings.historyPath, settings.historyLimit);
    if (!store.annotateObservedShelfLife(*batch, *actual)) {
        std::cerr << "[ShelfSenseApp] No un-annotated prediction found for batch " << *batch << std::endl;
        return kExitRejected;
    }
    std::cout << json{{"batchId", *batch}, {"actualShelfLife", *actual}}.dump(2) << std::endl;
    return kExitOk;
}

int ShelfSenseApp::RunProducts(const infrastructure::PredictorSettings& settings) {
    domain::KineticProfileCatalog catalog(settings.kineticProfiles);
    json j = json::array();
    for (const auto& key : catalog.products()) {
        const auto& p = catalog.at(key);
        j.push_back({
            {"product", key},
            {"activation_energy", p.activationEnergy},
            {"pre_exponential_factor", p.preExponentialFactor},
            {"reference_shelf_life_days", p.referenceShelfLifeDays},
            {"reference_temperature_c", p.referenceTemperatureC}
        });
    }
    std::cout << j.dump(2) << std::endl;
    return kExitOk;
}

} // namespace shelfsense::app
