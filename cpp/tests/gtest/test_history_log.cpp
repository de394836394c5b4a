// =============================================================================
// History Log Tests
// =============================================================================

#include <gtest/gtest.h>
#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <vector>

#include "fedrelay/error.hpp"
#include "fedrelay/history_log.hpp"

using namespace fedrelay;
namespace fs = std::filesystem;

class HistoryLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("fedrelay_history_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path dir_;
};

TEST_F(HistoryLogTest, RecordSerializesAuditFields) {
    AggregationRecord record;
    record.timestamp = "2026-10-18T09:12:44.123Z";
    record.id = "a1b2c3d4";
    record.model_name = "Digit Classifier";
    record.num_updates = 1;
    record.contributor_ids = {"alice"};
    record.round = 3;
    record.config["learningRate"] = 0.1;

    boost::json::object obj = record.to_json();
    EXPECT_EQ(obj.at("timestamp").as_string(), "2026-10-18T09:12:44.123Z");
    EXPECT_EQ(obj.at("id").as_string(), "a1b2c3d4");
    EXPECT_EQ(obj.at("modelName").as_string(), "Digit Classifier");
    EXPECT_EQ(obj.at("numUpdates").as_uint64(), 1u);
    EXPECT_EQ(obj.at("contributorIds").as_array().size(), 1u);
    EXPECT_EQ(obj.at("round").as_int64(), 3);
    EXPECT_DOUBLE_EQ(obj.at("config").as_object().at("learningRate").as_double(), 0.1);
}

TEST_F(HistoryLogTest, FileSinkWritesOneJsonFilePerRecord) {
    FileHistorySink sink(dir_);

    AggregationRecord record;
    record.timestamp = "2026-10-18T09:12:44.123Z";
    record.id = "deadbeef";
    record.model_name = "Digit Classifier";
    record.num_updates = 1;
    record.round = 2;
    sink.append(record);

    auto files = sink.list("Digit Classifier");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], dir_ / "Digit-Classifier" / "2026-10-18T09-12-44.123Z_deadbeef.json");

    boost::json::value parsed = boost::json::parse(slurp(files[0]));
    EXPECT_EQ(parsed.at("id").as_string(), "deadbeef");
    EXPECT_EQ(parsed.at("round").as_int64(), 2);
}

TEST_F(HistoryLogTest, FileSinkFailureRaisesHistoryLogError) {
    // A regular file in place of the history directory
    fs::create_directories(dir_.parent_path());
    std::ofstream(dir_) << "not a directory";

    FileHistorySink sink(dir_);
    AggregationRecord record;
    record.timestamp = "2026-10-18T09:12:44.123Z";
    record.id = "00000000";
    record.model_name = "m";
    EXPECT_THROW(sink.append(record), HistoryLogError);
    fs::remove(dir_);
}

TEST_F(HistoryLogTest, BackupWriterNamesFilesByRound) {
    BackupWriter writer(dir_, 10);
    fs::path p = writer.write("digits", 7, Bytes{1, 2, 3, 4});

    EXPECT_EQ(p.parent_path(), dir_ / "digits" / "models");
    EXPECT_EQ(p.filename().string().rfind("global_model_r7_", 0), 0u);
    EXPECT_EQ(p.extension(), ".bin");
    EXPECT_EQ(fs::file_size(p), 4u);
}

TEST_F(HistoryLogTest, BackupWriterPrunesOldest) {
    BackupWriter writer(dir_, 3);
    std::vector<fs::path> written;
    for (int round = 1; round <= 5; ++round) {
        written.push_back(writer.write("digits", round, Bytes{static_cast<uint8_t>(round), 0, 0, 0}));
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
    }

    auto kept = writer.list("digits");
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[0], written[2]);
    EXPECT_EQ(kept[2], written[4]);
    EXPECT_FALSE(fs::exists(written[0]));
}

TEST_F(HistoryLogTest, BackupWriterZeroKeepsEverything) {
    BackupWriter writer(dir_, 0);
    for (int round = 1; round <= 4; ++round) {
        writer.write("digits", round, Bytes{0, 0, 0, 0});
    }
    EXPECT_EQ(writer.list("digits").size(), 4u);
}

TEST(PrettyJsonTest, IndentsNestedValues) {
    boost::json::value v = {{"a", 1}, {"b", boost::json::array{true, "x"}}};
    EXPECT_EQ(pretty_json(v), "{\n  \"a\": 1,\n  \"b\": [\n    true,\n    \"x\"\n  ]\n}");
    EXPECT_EQ(pretty_json(boost::json::object{}), "{}");
}
