/**
 * Aggregation history: audit records and local backups of merged models.
 *
 * Both are best-effort from the coordinator's point of view. Failures raise
 * HistoryLogError, which the coordinator logs and swallows.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "fedrelay/types.hpp"

namespace fedrelay {

class HistorySink {
public:
    virtual ~HistorySink() = default;
    virtual void append(const AggregationRecord& record) = 0;
};

/**
 * One pretty-printed JSON file per record:
 *   <dir>/<model>/<timestamp>_<id>.json
 * with ':' in the timestamp replaced by '-' so the name is portable.
 */
class FileHistorySink : public HistorySink {
public:
    explicit FileHistorySink(std::filesystem::path dir);

    void append(const AggregationRecord& record) override;

    // Record files for a model, oldest first.
    std::vector<std::filesystem::path> list(const std::string& model_name) const;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};

/**
 * Local copies of each merged global model:
 *   <dir>/<model>/models/global_model_r<round>_<timestamp>.bin
 * Keeps at most `max_backups` files per model (0 keeps all), deleting the
 * oldest first.
 */
class BackupWriter {
public:
    BackupWriter(std::filesystem::path dir, size_t max_backups);

    // Returns the written path.
    std::filesystem::path write(const std::string& model_name, int64_t round, const Bytes& bytes);

    std::vector<std::filesystem::path> list(const std::string& model_name) const;

    size_t max_backups() const { return max_backups_; }

private:
    void prune(const std::filesystem::path& models_dir);

    std::filesystem::path dir_;
    size_t max_backups_;
    mutable std::mutex mutex_;
};

// Pretty-print a JSON value with two-space indentation.
std::string pretty_json(const boost::json::value& value);

} // namespace fedrelay
