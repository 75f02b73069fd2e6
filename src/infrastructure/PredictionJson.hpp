/**
 * @file PredictionJson.hpp
 * @brief JSON mapping for history records, telemetry samples and results.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/EnvironmentalReading.hpp"
#include "domain/PredictionRecord.hpp"
#include "domain/ShelfLifeResult.hpp"

namespace shelfsense::infrastructure {

/** @brief History file representation (snake_case keys). */
nlohmann::json RecordToJson(const domain::PredictionRecord& record);

/**
 * @brief Parses one history entry.
 * @throws nlohmann::json::exception if a required field is missing or mistyped.
 */
domain::PredictionRecord RecordFromJson(const nlohmann::json& j);

/**
 * @brief Parses a telemetry array of { "temperature", "humidity", "ts" } objects.
 *
 * Missing or null channels stay empty; entries that are not objects are skipped.
 */
std::vector<domain::EnvironmentalReading> ReadingsFromJson(const nlohmann::json& j);

/** @brief Serializes one telemetry sample in the readings-file shape. */
nlohmann::json ReadingToJson(const domain::EnvironmentalReading& reading);

/// Samples echoed under metadata.historySamples.
constexpr std::size_t kResultHistorySamples = 5;

/**
 * @brief Response shape consumed by API callers.
 * @param readings Resolved samples, newest first; the first kResultHistorySamples are echoed.
 */
nlohmann::json ResultToJson(const domain::ShelfLifeResult& result,
                            const std::string& productType,
                            const std::optional<std::string>& batchId,
                            const std::vector<domain::EnvironmentalReading>& readings = {});

} // namespace shelfsense::infrastructure
