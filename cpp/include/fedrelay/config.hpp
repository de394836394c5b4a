#pragma once

#include <cstdint>
#include <string>

#include "fedrelay/aggregation_engine.hpp"
#include "fedrelay/types.hpp"

namespace fedrelay {

struct AggregationConfig {
    double learning_rate = 0.1;
    int max_retries = 3;
    int64_t retry_base_delay_ms = 1000;
    BaselineMismatchPolicy baseline_mismatch = BaselineMismatchPolicy::Fail;
    int64_t persist_deadline_ms = 0;   // 0 = no deadline
};

struct HistoryConfig {
    bool enabled = true;
    std::string dir = "./aggregation_history";
    bool backup_enabled = true;
    int64_t max_backups = 10;           // 0 keeps every backup
};

struct StorageConfig {
    std::string backend = "filesystem"; // http | filesystem | postgres
    std::string base_url;
    std::string bearer_token;
    int64_t timeout_ms = 30000;
    int64_t max_body_bytes = 256LL * 1024 * 1024;  // largest GET response accepted; 0 = no limit
    std::string root = "./model_store";
    std::string conninfo;
    std::string table = "global_models";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    AggregationConfig aggregation;
    HistoryConfig history;
    StorageConfig storage;
    PrivacyParameters privacy;
    LoggingConfig logging;
    std::string config_file;
};

/**
 * Load configuration: defaults, then the YAML file, then FEDRELAY_* environment
 * variables, then validation.
 *
 * A missing file is not an error (defaults are used and a warning is logged).
 * Malformed values and failed validation throw InvalidParameterError.
 *
 * Environment overrides:
 *   FEDRELAY_LEARNING_RATE, FEDRELAY_MAX_RETRIES, FEDRELAY_RETRY_BASE_DELAY_MS,
 *   FEDRELAY_BASELINE_MISMATCH, FEDRELAY_PERSIST_DEADLINE_MS,
 *   FEDRELAY_HISTORY_ENABLED, FEDRELAY_HISTORY_DIR, FEDRELAY_BACKUP_ENABLED,
 *   FEDRELAY_MAX_BACKUPS, FEDRELAY_STORAGE_BACKEND, FEDRELAY_STORAGE_URL,
 *   FEDRELAY_STORAGE_TOKEN, FEDRELAY_STORAGE_TIMEOUT_MS, FEDRELAY_STORAGE_MAX_BODY_BYTES,
 *   FEDRELAY_STORAGE_ROOT,
 *   FEDRELAY_PG_CONNINFO, FEDRELAY_PG_TABLE, FEDRELAY_LOG_LEVEL, FEDRELAY_LOG_FILE
 */
Config load_config(const std::string& config_file = "fedrelay.yaml");

// Throws InvalidParameterError naming the first invalid setting.
void validate_config(const Config& config);

// Multi-line human-readable summary, printed at startup and by `fedrelay config`.
std::string config_summary(const Config& config);

// Applies logging.level and logging.file to the process logger.
void apply_logging(const LoggingConfig& logging);

} // namespace fedrelay
