/**
 * @file PredictionJson.cpp
 * @brief Implementation of the JSON mappings.
 */

#include "infrastructure/PredictionJson.hpp"
#include <chrono>

namespace shelfsense::infrastructure {

using json = nlohmann::json;

namespace {

long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::optional<double> OptionalNumber(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

} // namespace

json RecordToJson(const domain::PredictionRecord& record) {
    json j;
    j["batch_id"] = record.batchId ? json(*record.batchId) : json(nullptr);
    j["product"] = record.product;
    j["temperature"] = record.temperatureC;
    j["humidity"] = record.humidityPercent;
    j["ml_prediction"] = record.mlPrediction;
    j["arrhenius_prediction"] = record.arrheniusPrediction;
    j["hybrid_prediction"] = record.hybridPrediction;
    j["alpha_used"] = record.alphaUsed;
    j["sensor_samples"] = record.sensorSamples;
    j["recorded_at"] = ToMillis(record.recordedAt);
    if (record.actualShelfLifeDays) {
        j["actual_shelf_life"] = *record.actualShelfLifeDays;
    }
    return j;
}

domain::PredictionRecord RecordFromJson(const json& j) {
    domain::PredictionRecord record;
    record.product = j.at("product").get<std::string>();
    if (j.contains("batch_id") && j["batch_id"].is_string()) {
        record.batchId = j["batch_id"].get<std::string>();
    }
    record.temperatureC = j.at("temperature").get<double>();
    record.humidityPercent = j.at("humidity").get<double>();
    record.mlPrediction = j.at("ml_prediction").get<double>();
    record.arrheniusPrediction = j.at("arrhenius_prediction").get<double>();
    record.hybridPrediction = j.at("hybrid_prediction").get<double>();
    record.alphaUsed = j.at("alpha_used").get<double>();
    record.sensorSamples = j.value("sensor_samples", 0);
    record.recordedAt = FromMillis(j.value("recorded_at", 0LL));
    record.actualShelfLifeDays = OptionalNumber(j, "actual_shelf_life");
    return record;
}

std::vector<domain::EnvironmentalReading> ReadingsFromJson(const json& j) {
    std::vector<domain::EnvironmentalReading> readings;
    if (!j.is_array()) return readings;

    for (const auto& item : j) {
        if (!item.is_object()) continue;
        domain::EnvironmentalReading reading;
        reading.temperatureC = OptionalNumber(item, "temperature");
        reading.humidityPercent = OptionalNumber(item, "humidity");
        if (item.contains("ts") && item["ts"].is_number_integer()) {
            reading.capturedAt = FromMillis(item["ts"].get<long long>());
        }
        readings.push_back(reading);
    }
    return readings;
}

json ReadingToJson(const domain::EnvironmentalReading& reading) {
    json j;
    j["temperature"] = reading.temperatureC ? json(*reading.temperatureC) : json(nullptr);
    j["humidity"] = reading.humidityPercent ? json(*reading.humidityPercent) : json(nullptr);
    j["ts"] = ToMillis(reading.capturedAt);
    return j;
}

json ResultToJson(const domain::ShelfLifeResult& result,
                  const std::string& productType,
                  const std::optional<std::string>& batchId,
                  const std::vector<domain::EnvironmentalReading>& readings) {
    json j;
    j["batchId"] = batchId ? json(*batchId) : json(nullptr);
    j["productType"] = productType;
    j["mlPredictionDays"] = result.mlPrediction;
    j["arrheniusPredictionDays"] = result.arrheniusPrediction;
    j["hybridPredictionDays"] = result.hybridPrediction;
    j["alphaUsed"] = result.alphaUsed;
    j["sensorTemperatureC"] = result.sensorTemperatureC;
    j["sensorHumidityPercent"] = result.sensorHumidityPercent;
    j["sensorSamples"] = result.sensorSamples;
    json samples = json::array();
    for (std::size_t i = 0; i < readings.size() && i < kResultHistorySamples; ++i) {
        samples.push_back(ReadingToJson(readings[i]));
    }
    j["metadata"] = {
        {"sensorStability", result.sensorStability},
        {"mlPerformance", result.mlPerformance},
        {"historySamples", samples}
    };
    return j;
}

} // namespace shelfsense::infrastructure
