// =============================================================================
// PgModelStore Tests
// =============================================================================
//
// Needs a reachable PostgreSQL instance:
//   FEDRELAY_TEST_PG="host=localhost dbname=fedrelay user=postgres"
// Skipped otherwise.

#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <string>

#include "fedrelay/codec.hpp"
#include "fedrelay/db/connection.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/store/pg_model_store.hpp"

using namespace fedrelay;
using namespace fedrelay::store;

class PgModelStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* conninfo = std::getenv("FEDRELAY_TEST_PG");
        if (!conninfo || !*conninfo) {
            GTEST_SKIP() << "FEDRELAY_TEST_PG not set";
        }
        conninfo_ = std::string(conninfo) + " connect_timeout=5";
        try {
            store_ = std::make_unique<PgModelStore>(conninfo_, "fedrelay_test_models");
        } catch (const StorageReadError& e) {
            GTEST_SKIP() << "Database connection failed: " << e.what();
        }
        store_->ensure_schema();
        store_->remove(key_);
    }

    void TearDown() override {
        if (store_) {
            store_->remove(key_);
        }
    }

    const std::string key_ = "pg-test/globalModel.bin";
    std::string conninfo_;
    std::unique_ptr<PgModelStore> store_;
};

TEST_F(PgModelStoreTest, MissingRowIsNotFound) {
    EXPECT_FALSE(store_->get(key_).found());
    EXPECT_EQ(store_->version(key_), 0);
}

TEST_F(PgModelStoreTest, UpsertBumpsVersion) {
    const Bytes first = codec::encode_weights({1.0f, 2.0f});
    const Bytes second = codec::encode_weights({3.0f, 4.0f});

    PutResult p1 = store_->put(key_, first, {{"X-Aggregation-Round", "1"}});
    ASSERT_TRUE(p1.ok) << p1.message;
    EXPECT_EQ(p1.location, "postgres://fedrelay_test_models/" + key_ + "#v1");

    PutResult p2 = store_->put(key_, second, {{"X-Aggregation-Round", "2"}});
    ASSERT_TRUE(p2.ok) << p2.message;
    EXPECT_EQ(store_->version(key_), 2);

    FetchResult got = store_->get(key_);
    ASSERT_TRUE(got.found());
    EXPECT_EQ(got.bytes, second);
}

TEST_F(PgModelStoreTest, BinaryPayloadSurvivesIntact) {
    Bytes payload = {0x00, 0xFF, 0x00, 0x80, 0x5C, 0x27, 0x00, 0x01};
    ASSERT_TRUE(store_->put(key_, payload, {}).ok);
    EXPECT_EQ(store_->get(key_).bytes, payload);
}

TEST_F(PgModelStoreTest, TransactionRollsBackUnlessCommitted) {
    db::Connection conn(conninfo_);
    ASSERT_TRUE(conn.ok()) << conn.error();
    ASSERT_TRUE(db::exec(conn, "CREATE TEMP TABLE fedrelay_tx_check (v INT)").ok());

    {
        db::Transaction tx(conn);
        ASSERT_TRUE(tx.ok()) << tx.error();
        ASSERT_TRUE(db::exec(conn, "INSERT INTO fedrelay_tx_check VALUES (1)").ok());
    }
    EXPECT_EQ(db::exec(conn, "SELECT v FROM fedrelay_tx_check").ntuples(), 0);

    {
        db::Transaction tx(conn);
        ASSERT_TRUE(db::exec(conn, "INSERT INTO fedrelay_tx_check VALUES (2)").ok());
        EXPECT_TRUE(tx.commit()) << tx.error();
        EXPECT_FALSE(tx.commit());
    }
    EXPECT_EQ(db::exec(conn, "SELECT v FROM fedrelay_tx_check").ntuples(), 1);
}

TEST_F(PgModelStoreTest, PutLeavesNoOpenTransaction) {
    ASSERT_TRUE(store_->put(key_, codec::encode_weights({1.0f}), {}).ok);
    // Another session only sees committed rows.
    ASSERT_TRUE(store_->put(key_, codec::encode_weights({2.0f}), {}).ok);

    PgModelStore other(conninfo_, "fedrelay_test_models");
    FetchResult got = other.get(key_);
    ASSERT_TRUE(got.found());
    EXPECT_EQ(codec::decode_weights(got.bytes), (WeightVector{2.0f}));
}

TEST(PgModelStoreConfigTest, RejectsUnsafeTableName) {
    EXPECT_THROW(PgModelStore("host=invalid.invalid connect_timeout=1", "models; DROP TABLE x"),
                 InvalidParameterError);
}
