#include <atomic>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

#include "application/ShelfLifePredictor.hpp"
#include "domain/ShelfLifeErrors.hpp"
#include "infrastructure/PredictionHistoryStoreFs.hpp"

using namespace shelfsense;
using application::PredictionRequest;
using application::ShelfLifePredictor;

// Mock regressor: 40 days minus the temperature, counts its invocations.
class MockRegressionModel : public domain::RegressionModel {
public:
    explicit MockRegressionModel(std::vector<std::string> names = {"Temperature_C", "Humidity_%", "Type_Apple", "Type_Banana"})
        : m_names(std::move(names)) {}

    const std::vector<std::string>& featureNames() const override { return m_names; }
    double predict(const std::vector<double>& features) const override {
        ++calls;
        return 40.0 - features[0];
    }

    mutable std::atomic<int> calls{0};

private:
    std::vector<std::string> m_names;
};

static std::unique_ptr<ShelfLifePredictor> MakePredictor(const std::string& historyPath,
                                                        std::shared_ptr<MockRegressionModel> model) {
    auto store = std::make_shared<infrastructure::PredictionHistoryStoreFs>(historyPath);
    return std::make_unique<ShelfLifePredictor>(domain::KineticProfileCatalog::BuiltIn(), store,
                                                application::RegressorAdapter(model));
}

static PredictionRequest AppleAtReference() {
    PredictionRequest request;
    request.productType = "Apple";
    request.temperatureC = 5.0;
    request.humidityPercent = 90.0;
    return request;
}

static bool Near(double a, double b) { return std::abs(a - b) < 1e-9; }

int main() {
    std::cout << "[Test] Starting ShelfLifePredictor Test..." << std::endl;

    std::string testRoot = "test_project_root_predictor";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    // --- Reference scenario with no telemetry and no history ---
    {
        auto model = std::make_shared<MockRegressionModel>();
        auto predictor = MakePredictor(testRoot + "/a.json", model);
        auto result = predictor->predict(AppleAtReference());

        assert(result.arrheniusPrediction == 60.0);
        assert(result.mlPrediction == 35.0);
        assert(result.sensorStability == 0.5);
        assert(result.mlPerformance == 0.5);
        assert(Near(result.alphaUsed, 0.35));
        assert(Near(result.hybridPrediction, result.alphaUsed * 60.0 + (1.0 - result.alphaUsed) * 35.0));
        assert(result.sensorSamples == 0);
        assert(result.sensorTemperatureC == 5.0 && result.sensorHumidityPercent == 90.0);

        infrastructure::PredictionHistoryStoreFs store(testRoot + "/a.json");
        auto history = store.loadAll();
        assert(history.size() == 1);
        assert(history[0].product == "apple");
        assert(history[0].hybridPrediction == result.hybridPrediction);
        assert(history[0].alphaUsed == result.alphaUsed);

        // Second identical call: one prior prediction still cannot show consistency.
        auto second = predictor->predict(AppleAtReference());
        assert(second.mlPerformance == 0.5);

        // Third call: two identical regressor outputs are fully consistent,
        // pulling weight towards the regressor.
        auto third = predictor->predict(AppleAtReference());
        assert(Near(third.mlPerformance, 1.0));
        assert(Near(third.alphaUsed, 0.35 - 0.5 * 0.40));
        assert(Near(third.hybridPrediction, third.alphaUsed * third.arrheniusPrediction
                                            + (1.0 - third.alphaUsed) * third.mlPrediction));

        auto summary = predictor->summarizeHistory();
        assert(summary.entries == 3);
        assert(summary.recentMlPrediction && Near(*summary.recentMlPrediction, 35.0));
        assert(summary.recentAlpha && Near(*summary.recentAlpha, (0.35 + 0.35 + 0.15) / 3.0));
    }

    // --- Determinism across independent predictors ---
    {
        auto m1 = std::make_shared<MockRegressionModel>();
        auto m2 = std::make_shared<MockRegressionModel>();
        auto p1 = MakePredictor(testRoot + "/d1.json", m1);
        auto p2 = MakePredictor(testRoot + "/d2.json", m2);

        PredictionRequest request;
        request.productType = "banana";
        request.temperatureC = 14.0;
        request.humidityPercent = 80.0;
        for (int i = 0; i < 6; ++i) {
            domain::EnvironmentalReading r;
            r.temperatureC = 13.0 + 0.4 * i;
            r.humidityPercent = 78.0 + i;
            request.readings.push_back(r);
        }

        auto r1 = p1->predict(request);
        auto r2 = p2->predict(request);
        assert(r1.alphaUsed == r2.alphaUsed);
        assert(r1.arrheniusPrediction == r2.arrheniusPrediction);
        assert(r1.mlPrediction == r2.mlPrediction);
        assert(r1.hybridPrediction == r2.hybridPrediction);
        assert(r1.sensorSamples == 6);
        assert(r1.sensorStability > 0.0 && r1.sensorStability < 1.0);
        assert(r1.alphaUsed >= 0.1 && r1.alphaUsed <= 0.8);
        assert(r1.arrheniusPrediction < 14.0); // warmer than reference, drier than optimum
    }

    // --- Alpha override ---
    {
        auto predictor = MakePredictor(testRoot + "/o.json", std::make_shared<MockRegressionModel>());
        auto request = AppleAtReference();
        request.alphaOverride = 1.4;
        auto result = predictor->predict(request);
        assert(result.alphaUsed == 1.0);
        assert(result.hybridPrediction == result.arrheniusPrediction);

        request.alphaOverride = 0.0;
        result = predictor->predict(request);
        assert(result.alphaUsed == 0.0);
        assert(result.hybridPrediction == result.mlPrediction);
    }

    // --- Unsupported product: rejected before either model runs, nothing written ---
    {
        auto model = std::make_shared<MockRegressionModel>();
        auto predictor = MakePredictor(testRoot + "/u.json", model);
        PredictionRequest request = AppleAtReference();
        request.productType = "durian";

        bool threw = false;
        try {
            predictor->predict(request);
        } catch (const domain::UnsupportedProductError&) {
            threw = true;
        }
        assert(threw);
        assert(model->calls == 0);
        assert(!std::filesystem::exists(testRoot + "/u.json"));
    }

    // --- Bad model schema: call aborts with no history write ---
    {
        auto model = std::make_shared<MockRegressionModel>(std::vector<std::string>{});
        auto predictor = MakePredictor(testRoot + "/s.json", model);
        bool threw = false;
        try {
            predictor->predict(AppleAtReference());
        } catch (const domain::InvalidModelSchemaError&) {
            threw = true;
        }
        assert(threw);
        assert(!std::filesystem::exists(testRoot + "/s.json"));
    }

    // --- Corrupted history: the call succeeds with default confidence ---
    {
        std::string path = testRoot + "/c.json";
        {
            std::ofstream out(path);
            out << "[{\"product\": \"apple\", \"ml_prediction\": ";
        }
        auto predictor = MakePredictor(path, std::make_shared<MockRegressionModel>());
        auto result = predictor->predict(AppleAtReference());
        assert(result.mlPerformance == 0.5);
        assert(result.sensorStability == 0.5);
        assert(Near(result.alphaUsed, 0.35));

        infrastructure::PredictionHistoryStoreFs store(path);
        assert(store.loadAll().size() == 1);
    }

    // --- Observed outcomes feed the accuracy tier ---
    {
        auto predictor = MakePredictor(testRoot + "/v.json", std::make_shared<MockRegressionModel>());
        auto request = AppleAtReference();
        request.batchId = "BATCH-7";
        auto first = predictor->predict(request);

        assert(predictor->recordObservedShelfLife("BATCH-7", first.hybridPrediction));
        auto next = predictor->predict(request);
        assert(Near(next.mlPerformance, 1.0));

        bool threw = false;
        try {
            predictor->recordObservedShelfLife("BATCH-7", 0.0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            predictor->recordObservedShelfLife("BATCH-7", std::numeric_limits<double>::infinity());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // --- Extreme heat keeps every prediction non-negative ---
    {
        auto predictor = MakePredictor(testRoot + "/h.json", std::make_shared<MockRegressionModel>());
        PredictionRequest request;
        request.productType = "tomato";
        request.temperatureC = 55.0;
        request.humidityPercent = 20.0;
        auto result = predictor->predict(request);
        assert(result.mlPrediction == 0.0);
        assert(result.arrheniusPrediction > 0.0);
        assert(result.hybridPrediction >= 0.0);
    }

    auto products = MakePredictor(testRoot + "/p.json", std::make_shared<MockRegressionModel>())->supportedProducts();
    assert((products == std::vector<std::string>{"apple", "banana", "mango", "potato", "tomato"}));

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ShelfLifePredictor Test." << std::endl;
    return 0;
}
