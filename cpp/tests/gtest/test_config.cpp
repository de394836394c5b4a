// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "fedrelay/config.hpp"
#include "fedrelay/error.hpp"

using namespace fedrelay;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_config_path_ = (std::filesystem::temp_directory_path() / "fedrelay_test_config.yaml").string();
    }

    void TearDown() override {
        for (const auto& name : env_set_) {
            unsetenv(name.c_str());
        }
        if (std::filesystem::exists(temp_config_path_)) {
            std::filesystem::remove(temp_config_path_);
        }
    }

    void write_config(const std::string& yaml) {
        std::ofstream config_file(temp_config_path_);
        config_file << yaml;
    }

    void set_env(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        env_set_.push_back(name);
    }

    std::string temp_config_path_;
    std::vector<std::string> env_set_;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    Config config = load_config("/nonexistent/fedrelay.yaml");
    EXPECT_DOUBLE_EQ(config.aggregation.learning_rate, 0.1);
    EXPECT_EQ(config.aggregation.max_retries, 3);
    EXPECT_EQ(config.aggregation.retry_base_delay_ms, 1000);
    EXPECT_EQ(config.aggregation.baseline_mismatch, BaselineMismatchPolicy::Fail);
    EXPECT_TRUE(config.history.enabled);
    EXPECT_TRUE(config.history.backup_enabled);
    EXPECT_EQ(config.history.dir, "./aggregation_history");
    EXPECT_EQ(config.history.max_backups, 10);
    EXPECT_EQ(config.storage.backend, "filesystem");
    EXPECT_EQ(config.storage.max_body_bytes, 256LL * 1024 * 1024);
    EXPECT_DOUBLE_EQ(config.privacy.epsilon, 1.0);
    EXPECT_DOUBLE_EQ(config.privacy.delta, 1e-5);
}

TEST_F(ConfigTest, LoadsYamlValues) {
    write_config(R"(
aggregation:
  learning_rate: 0.25
  max_retries: 5
  retry_base_delay_ms: 200
  baseline_mismatch: ignore_baseline
  persist_deadline_ms: 15000

history:
  enabled: false
  dir: "/var/lib/fedrelay/history"
  backup_enabled: true
  max_backups: 0

storage:
  backend: http
  base_url: "https://pod.example.org/fedrelay/"
  bearer_token: "secret"
  timeout_ms: 5000
  max_body_bytes: 0

privacy:
  epsilon: 0.5
  delta: 1.0e-6
  l2_norm_clip: 2.0
  sample_rate: 0.05

logging:
  level: debug
  file: "fedrelay.log"
)");

    Config config = load_config(temp_config_path_);
    EXPECT_DOUBLE_EQ(config.aggregation.learning_rate, 0.25);
    EXPECT_EQ(config.aggregation.max_retries, 5);
    EXPECT_EQ(config.aggregation.retry_base_delay_ms, 200);
    EXPECT_EQ(config.aggregation.baseline_mismatch, BaselineMismatchPolicy::IgnoreBaseline);
    EXPECT_EQ(config.aggregation.persist_deadline_ms, 15000);
    EXPECT_FALSE(config.history.enabled);
    EXPECT_EQ(config.history.dir, "/var/lib/fedrelay/history");
    EXPECT_EQ(config.history.max_backups, 0);
    EXPECT_EQ(config.storage.backend, "http");
    EXPECT_EQ(config.storage.base_url, "https://pod.example.org/fedrelay/");
    EXPECT_EQ(config.storage.bearer_token, "secret");
    EXPECT_EQ(config.storage.timeout_ms, 5000);
    EXPECT_EQ(config.storage.max_body_bytes, 0);
    EXPECT_DOUBLE_EQ(config.privacy.epsilon, 0.5);
    EXPECT_DOUBLE_EQ(config.privacy.delta, 1e-6);
    EXPECT_DOUBLE_EQ(config.privacy.l2_norm_clip, 2.0);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "fedrelay.log");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_config(R"(
aggregation:
  learning_rate: 0.25
storage:
  backend: filesystem
  root: "/tmp/models"
)");
    set_env("FEDRELAY_LEARNING_RATE", "0.75");
    set_env("FEDRELAY_MAX_RETRIES", "6");
    set_env("FEDRELAY_STORAGE_ROOT", "/srv/models");
    set_env("FEDRELAY_BACKUP_ENABLED", "off");

    Config config = load_config(temp_config_path_);
    EXPECT_DOUBLE_EQ(config.aggregation.learning_rate, 0.75);
    EXPECT_EQ(config.aggregation.max_retries, 6);
    EXPECT_EQ(config.storage.root, "/srv/models");
    EXPECT_FALSE(config.history.backup_enabled);
}

TEST_F(ConfigTest, RejectsLearningRateOutsideRange) {
    write_config("aggregation:\n  learning_rate: 0\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);

    write_config("aggregation:\n  learning_rate: 1.5\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);
}

TEST_F(ConfigTest, RejectsZeroRetries) {
    write_config("aggregation:\n  max_retries: 0\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);
}

TEST_F(ConfigTest, RejectsRetryCountsThatDoNotFitAnInt) {
    // 2^32 + 1 would narrow to 1.
    set_env("FEDRELAY_MAX_RETRIES", "4294967297");
    EXPECT_THROW(load_config(""), InvalidParameterError);

    set_env("FEDRELAY_MAX_RETRIES", "-1");
    EXPECT_THROW(load_config(""), InvalidParameterError);

    set_env("FEDRELAY_MAX_RETRIES", "1000");
    EXPECT_EQ(load_config("").aggregation.max_retries, 1000);
}

TEST_F(ConfigTest, RejectsNegativeBodyLimit) {
    set_env("FEDRELAY_STORAGE_BACKEND", "http");
    set_env("FEDRELAY_STORAGE_URL", "http://localhost:3000/pod");
    set_env("FEDRELAY_STORAGE_MAX_BODY_BYTES", "-5");
    EXPECT_THROW(load_config(""), InvalidParameterError);

    set_env("FEDRELAY_STORAGE_MAX_BODY_BYTES", "104857600");
    EXPECT_EQ(load_config("").storage.max_body_bytes, 104857600);
}

TEST_F(ConfigTest, RejectsMalformedValues) {
    write_config("aggregation:\n  max_retries: three\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);

    write_config("aggregation:\n  baseline_mismatch: truncate\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);

    write_config("aggregation: [unterminated\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);
}

TEST_F(ConfigTest, RejectsMalformedEnvironment) {
    set_env("FEDRELAY_LEARNING_RATE", "fast");
    EXPECT_THROW(load_config(""), InvalidParameterError);
}

TEST_F(ConfigTest, BackendRequiresItsSettings) {
    write_config("storage:\n  backend: http\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);

    write_config("storage:\n  backend: postgres\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);

    write_config("storage:\n  backend: s3\n");
    EXPECT_THROW(load_config(temp_config_path_), InvalidParameterError);
}

TEST_F(ConfigTest, SummaryMentionsKeySettings) {
    Config config = load_config("");
    std::string summary = config_summary(config);
    EXPECT_NE(summary.find("learning rate:     0.1"), std::string::npos);
    EXPECT_NE(summary.find("max retries:       3"), std::string::npos);
    EXPECT_NE(summary.find("backend:           filesystem"), std::string::npos);
    EXPECT_NE(summary.find("./aggregation_history"), std::string::npos);
}
