/**
 * @file PredictionHistoryRepository.hpp
 * @brief Interface for persisting prediction history.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/PredictionRecord.hpp"

namespace shelfsense::domain {

class PredictionHistoryRepository {
public:
    virtual ~PredictionHistoryRepository() = default;

    // Appends one record; implementations keep only their retention window.
    // Returns false if the write could not be made durable.
    virtual bool append(const PredictionRecord& record) = 0;

    // Oldest first. A damaged store yields an empty list, never an exception.
    virtual std::vector<PredictionRecord> loadAll() = 0;

    // Attaches an observed shelf life to the newest un-annotated record of the batch.
    // Throws std::invalid_argument unless IsValidObservedShelfLife(actualDays).
    virtual bool annotateObservedShelfLife(const std::string& batchId, double actualDays) = 0;
};

} // namespace shelfsense::domain
