#include "fedrelay/config.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace fedrelay {

namespace {

constexpr int64_t kMaxRetriesLimit = 1000;

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_bool(const std::string& name, const std::string& raw) {
    const std::string v = lower(raw);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw InvalidParameterError("Invalid boolean for " + name + ": '" + raw + "'", "load_config");
}

double parse_double(const std::string& name, const std::string& raw) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(raw, &pos);
    } catch (const std::exception& e) {
        throw InvalidParameterError("Invalid number for " + name + ": '" + raw + "' (" + e.what() + ")",
                                    "load_config");
    }
    if (pos != raw.size()) {
        throw InvalidParameterError("Invalid number for " + name + ": '" + raw + "'", "load_config");
    }
    return v;
}

int64_t parse_int(const std::string& name, const std::string& raw) {
    size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(raw, &pos);
    } catch (const std::exception& e) {
        throw InvalidParameterError("Invalid integer for " + name + ": '" + raw + "' (" + e.what() + ")",
                                    "load_config");
    }
    if (pos != raw.size()) {
        throw InvalidParameterError("Invalid integer for " + name + ": '" + raw + "'", "load_config");
    }
    return v;
}

void env_string(const char* var, std::string& out) {
    if (const char* v = env_value(var)) out = v;
}

void env_double(const char* var, double& out) {
    if (const char* v = env_value(var)) out = parse_double(var, v);
}

void env_int(const char* var, int64_t& out) {
    if (const char* v = env_value(var)) out = parse_int(var, v);
}

void env_bool(const char* var, bool& out) {
    if (const char* v = env_value(var)) out = parse_bool(var, v);
}

// yaml-cpp reports conversion failures as YAML::BadConversion; rethrown with the key name.
template <typename T>
void read(const YAML::Node& node, const char* key, const std::string& section, T& out) {
    if (!node[key]) return;
    try {
        out = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidParameterError("Invalid value for " + section + "." + key + ": " + e.what(),
                                    "load_config");
    }
}

void load_from_yaml(const std::string& path, Config& config) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw InvalidParameterError("Cannot parse config file " + path + ": " + e.what(),
                                    "load_config");
    }

    if (const auto agg = yaml["aggregation"]) {
        read(agg, "learning_rate", "aggregation", config.aggregation.learning_rate);
        read(agg, "max_retries", "aggregation", config.aggregation.max_retries);
        read(agg, "retry_base_delay_ms", "aggregation", config.aggregation.retry_base_delay_ms);
        read(agg, "persist_deadline_ms", "aggregation", config.aggregation.persist_deadline_ms);
        std::string policy;
        read(agg, "baseline_mismatch", "aggregation", policy);
        if (!policy.empty()) {
            config.aggregation.baseline_mismatch = parse_baseline_mismatch_policy(policy);
        }
    }

    if (const auto hist = yaml["history"]) {
        read(hist, "enabled", "history", config.history.enabled);
        read(hist, "dir", "history", config.history.dir);
        read(hist, "backup_enabled", "history", config.history.backup_enabled);
        read(hist, "max_backups", "history", config.history.max_backups);
    }

    if (const auto st = yaml["storage"]) {
        read(st, "backend", "storage", config.storage.backend);
        read(st, "base_url", "storage", config.storage.base_url);
        read(st, "bearer_token", "storage", config.storage.bearer_token);
        read(st, "timeout_ms", "storage", config.storage.timeout_ms);
        read(st, "max_body_bytes", "storage", config.storage.max_body_bytes);
        read(st, "root", "storage", config.storage.root);
        read(st, "conninfo", "storage", config.storage.conninfo);
        read(st, "table", "storage", config.storage.table);
    }

    if (const auto priv = yaml["privacy"]) {
        read(priv, "epsilon", "privacy", config.privacy.epsilon);
        read(priv, "delta", "privacy", config.privacy.delta);
        read(priv, "l2_norm_clip", "privacy", config.privacy.l2_norm_clip);
        read(priv, "sample_rate", "privacy", config.privacy.sample_rate);
    }

    if (const auto log = yaml["logging"]) {
        read(log, "level", "logging", config.logging.level);
        read(log, "file", "logging", config.logging.file);
    }
}

void load_from_env(Config& config) {
    env_double("FEDRELAY_LEARNING_RATE", config.aggregation.learning_rate);
    int64_t retries = config.aggregation.max_retries;
    env_int("FEDRELAY_MAX_RETRIES", retries);
    if (retries < 1 || retries > kMaxRetriesLimit) {
        throw InvalidParameterError("FEDRELAY_MAX_RETRIES must be in [1, " + std::to_string(kMaxRetriesLimit) +
                                    "], got " + std::to_string(retries), "load_config");
    }
    config.aggregation.max_retries = static_cast<int>(retries);
    env_int("FEDRELAY_RETRY_BASE_DELAY_MS", config.aggregation.retry_base_delay_ms);
    env_int("FEDRELAY_PERSIST_DEADLINE_MS", config.aggregation.persist_deadline_ms);
    if (const char* v = env_value("FEDRELAY_BASELINE_MISMATCH")) {
        config.aggregation.baseline_mismatch = parse_baseline_mismatch_policy(v);
    }

    env_bool("FEDRELAY_HISTORY_ENABLED", config.history.enabled);
    env_string("FEDRELAY_HISTORY_DIR", config.history.dir);
    env_bool("FEDRELAY_BACKUP_ENABLED", config.history.backup_enabled);
    env_int("FEDRELAY_MAX_BACKUPS", config.history.max_backups);

    env_string("FEDRELAY_STORAGE_BACKEND", config.storage.backend);
    env_string("FEDRELAY_STORAGE_URL", config.storage.base_url);
    env_string("FEDRELAY_STORAGE_TOKEN", config.storage.bearer_token);
    env_int("FEDRELAY_STORAGE_TIMEOUT_MS", config.storage.timeout_ms);
    env_int("FEDRELAY_STORAGE_MAX_BODY_BYTES", config.storage.max_body_bytes);
    env_string("FEDRELAY_STORAGE_ROOT", config.storage.root);
    env_string("FEDRELAY_PG_CONNINFO", config.storage.conninfo);
    env_string("FEDRELAY_PG_TABLE", config.storage.table);

    env_string("FEDRELAY_LOG_LEVEL", config.logging.level);
    env_string("FEDRELAY_LOG_FILE", config.logging.file);
}

} // namespace

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    if (config_file.empty()) {
        LOG_DEBUG("No config file given, using defaults");
    } else if (!std::filesystem::exists(config_file)) {
        LOG_WARN("Config file {} not found, using defaults", config_file);
    } else {
        load_from_yaml(config_file, config);
        LOG_DEBUG("Loaded configuration from {}", config_file);
    }

    load_from_env(config);
    validate_config(config);
    return config;
}

void validate_config(const Config& config) {
    const auto& agg = config.aggregation;
    if (!(agg.learning_rate > 0.0 && agg.learning_rate <= 1.0)) {
        throw InvalidParameterError("aggregation.learning_rate must be in (0, 1], got " +
                                    std::to_string(agg.learning_rate), "validate_config");
    }
    if (agg.max_retries < 1 || agg.max_retries > kMaxRetriesLimit) {
        throw InvalidParameterError("aggregation.max_retries must be in [1, " + std::to_string(kMaxRetriesLimit) +
                                    "], got " +
                                    std::to_string(agg.max_retries), "validate_config");
    }
    if (agg.retry_base_delay_ms < 0) {
        throw InvalidParameterError("aggregation.retry_base_delay_ms must be >= 0", "validate_config");
    }
    if (agg.persist_deadline_ms < 0) {
        throw InvalidParameterError("aggregation.persist_deadline_ms must be >= 0", "validate_config");
    }

    if (config.history.max_backups < 0) {
        throw InvalidParameterError("history.max_backups must be >= 0", "validate_config");
    }
    if ((config.history.enabled || config.history.backup_enabled) && config.history.dir.empty()) {
        throw InvalidParameterError("history.dir must be set when history or backups are enabled",
                                    "validate_config");
    }

    const auto& st = config.storage;
    if (st.backend == "http") {
        if (st.base_url.empty()) {
            throw InvalidParameterError("storage.base_url is required for the http backend",
                                        "validate_config");
        }
        if (st.timeout_ms <= 0) {
            throw InvalidParameterError("storage.timeout_ms must be > 0", "validate_config");
        }
        if (st.max_body_bytes < 0) {
            throw InvalidParameterError("storage.max_body_bytes must be >= 0", "validate_config");
        }
    } else if (st.backend == "filesystem") {
        if (st.root.empty()) {
            throw InvalidParameterError("storage.root is required for the filesystem backend",
                                        "validate_config");
        }
    } else if (st.backend == "postgres") {
        if (st.conninfo.empty()) {
            throw InvalidParameterError("storage.conninfo is required for the postgres backend",
                                        "validate_config");
        }
    } else {
        throw InvalidParameterError("Unknown storage.backend '" + st.backend + "'", "validate_config",
                                    "Use one of: http, filesystem, postgres");
    }

    config.privacy.validate();
}

std::string config_summary(const Config& config) {
    std::ostringstream os;
    os << "=== FedRelay Configuration ===\n";
    if (!config.config_file.empty()) {
        os << "Config file:        " << config.config_file << "\n";
    }
    os << "Aggregation:\n"
       << "  learning rate:     " << config.aggregation.learning_rate << "\n"
       << "  max retries:       " << config.aggregation.max_retries << "\n"
       << "  retry base delay:  " << config.aggregation.retry_base_delay_ms << " ms\n"
       << "  baseline mismatch: " << baseline_mismatch_policy_name(config.aggregation.baseline_mismatch) << "\n"
       << "  persist deadline:  ";
    if (config.aggregation.persist_deadline_ms > 0) {
        os << config.aggregation.persist_deadline_ms << " ms\n";
    } else {
        os << "none\n";
    }

    os << "History:\n"
       << "  save history:      " << (config.history.enabled ? "yes" : "no") << "\n"
       << "  directory:         " << config.history.dir << "\n"
       << "  backup models:     " << (config.history.backup_enabled ? "yes" : "no") << "\n"
       << "  max backups:       ";
    if (config.history.max_backups > 0) {
        os << config.history.max_backups << "\n";
    } else {
        os << "unlimited\n";
    }

    os << "Storage:\n"
       << "  backend:           " << config.storage.backend << "\n";
    if (config.storage.backend == "http") {
        os << "  base url:          " << config.storage.base_url << "\n"
           << "  bearer token:      " << (config.storage.bearer_token.empty() ? "none" : "set") << "\n"
           << "  timeout:           " << config.storage.timeout_ms << " ms\n"
           << "  max body:          ";
        if (config.storage.max_body_bytes > 0) {
            os << config.storage.max_body_bytes << " bytes\n";
        } else {
            os << "unlimited\n";
        }
    } else if (config.storage.backend == "filesystem") {
        os << "  root:              " << config.storage.root << "\n";
    } else if (config.storage.backend == "postgres") {
        os << "  table:             " << config.storage.table << "\n";
    }

    os << "Privacy defaults:\n"
       << "  epsilon:           " << config.privacy.epsilon << "\n"
       << "  delta:             " << config.privacy.delta << "\n"
       << "  l2 norm clip:      " << config.privacy.l2_norm_clip << "\n"
       << "  sample rate:       " << config.privacy.sample_rate << "\n";

    os << "Logging:\n"
       << "  level:             " << config.logging.level << "\n"
       << "  file:              " << (config.logging.file.empty() ? "none" : config.logging.file) << "\n";
    return os.str();
}

void apply_logging(const LoggingConfig& logging) {
    auto& logger = Logger::getInstance();
    LogLevel level = LogLevel::INFO;
    if (!parse_log_level(logging.level, level)) {
        LOG_WARN("Unknown log level '{}', using info", logging.level);
    }
    logger.set_level(level);
    if (!logging.file.empty()) {
        logger.set_output_file(logging.file);
    }
}

} // namespace fedrelay
