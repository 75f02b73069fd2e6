/**
 * @file PredictionHistoryStoreFs.cpp
 * @brief Implementation of PredictionHistoryStoreFs.
 */

#include "infrastructure/PredictionHistoryStoreFs.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PredictionJson.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace shelfsense::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

PredictionHistoryStoreFs::PredictionHistoryStoreFs(std::string historyPath, std::size_t retention)
    : m_path(std::move(historyPath)), m_retention(retention) {
    if (m_retention == 0) {
        throw std::invalid_argument("PredictionHistoryStoreFs: Retention must be at least one entry.");
    }
}

std::vector<domain::PredictionRecord> PredictionHistoryStoreFs::readUnlocked() const {
    std::vector<domain::PredictionRecord> records;
    std::error_code ec;
    if (!fs::exists(m_path, ec)) return records;

    try {
        std::ifstream f(m_path);
        if (!f.is_open()) {
            std::cerr << "[PredictionHistoryStoreFs] Cannot open " << m_path << ", using empty history." << std::endl;
            return records;
        }

        json j = json::parse(f);
        if (!j.is_array()) {
            std::cerr << "[PredictionHistoryStoreFs] " << m_path << " is not a JSON array, using empty history." << std::endl;
            return records;
        }

        for (const auto& item : j) {
            try {
                records.push_back(RecordFromJson(item));
            } catch (const json::exception&) {
                // Skip malformed entries
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[PredictionHistoryStoreFs] Failed to parse history file: " << e.what() << std::endl;
        records.clear();
    }
    return records;
}

bool PredictionHistoryStoreFs::writeUnlocked(const std::vector<domain::PredictionRecord>& records) const {
    std::size_t start = records.size() > m_retention ? records.size() - m_retention : 0;
    json payload = json::array();
    for (std::size_t i = start; i < records.size(); ++i) {
        payload.push_back(RecordToJson(records[i]));
    }
    return AtomicFileWriter::Write(m_path, payload.dump(2));
}

bool PredictionHistoryStoreFs::append(const domain::PredictionRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = readUnlocked();
    records.push_back(record);
    return writeUnlocked(records);
}

std::vector<domain::PredictionRecord> PredictionHistoryStoreFs::loadAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return readUnlocked();
}

bool PredictionHistoryStoreFs::annotateObservedShelfLife(const std::string& batchId, double actualDays) {
    if (!domain::IsValidObservedShelfLife(actualDays)) {
        throw std::invalid_argument("PredictionHistoryStoreFs: Observed shelf life must be a finite positive number of days.");
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto records = readUnlocked();
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        if (it->batchId && *it->batchId == batchId && !it->actualShelfLifeDays) {
            it->actualShelfLifeDays = actualDays;
            return writeUnlocked(records);
        }
    }
    return false;
}

} // namespace shelfsense::infrastructure
