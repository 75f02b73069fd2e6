/**
 * @file PredictionHistoryStoreFs.hpp
 * @brief File-system based, size-bounded prediction history.
 */

#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "domain/PredictionHistoryRepository.hpp"

namespace shelfsense::infrastructure {

/**
 * @class PredictionHistoryStoreFs
 * @brief Keeps the most recent entries in a single JSON array file.
 *
 * Every write rewrites the whole file through AtomicFileWriter. The
 * load-append-trim-save cycle is serialized per instance.
 */
class PredictionHistoryStoreFs : public domain::PredictionHistoryRepository {
public:
    static constexpr std::size_t kDefaultRetention = 120;

    explicit PredictionHistoryStoreFs(std::string historyPath, std::size_t retention = kDefaultRetention);

    bool append(const domain::PredictionRecord& record) override;
    std::vector<domain::PredictionRecord> loadAll() override;
    bool annotateObservedShelfLife(const std::string& batchId, double actualDays) override;

    const std::string& path() const { return m_path; }
    std::size_t retention() const { return m_retention; }

private:
    std::vector<domain::PredictionRecord> readUnlocked() const;
    bool writeUnlocked(const std::vector<domain::PredictionRecord>& records) const;

    std::string m_path;
    std::size_t m_retention;
    std::mutex m_mutex;
};

} // namespace shelfsense::infrastructure
