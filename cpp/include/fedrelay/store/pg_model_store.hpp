#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "fedrelay/db/connection.hpp"
#include "fedrelay/store/model_store.hpp"

namespace fedrelay::store {

/**
 * PostgreSQL-backed model store.
 *
 * One row per key: payload (bytea), headers of the last write (jsonb), and a
 * version counter bumped by every put. A put is a single upsert statement, so
 * readers see either the old row or the new one.
 */
class PgModelStore : public ModelStore {
public:
    // Throws StorageReadError if the connection cannot be established.
    PgModelStore(const std::string& conninfo, std::string table = "global_models");

    FetchResult get(const std::string& key) override;
    PutResult put(const std::string& key, const Bytes& bytes, const Headers& headers) override;
    std::string describe() const override;

    // CREATE TABLE IF NOT EXISTS for the backing table.
    void ensure_schema();

    // Version of the stored row, 0 if absent.
    int64_t version(const std::string& key);

    // Deletes the row; used by tests and maintenance tooling.
    void remove(const std::string& key);

private:
    // Caller holds mutex_.
    void ensure_connected();

    db::Connection conn_;
    std::string table_;
    std::mutex mutex_;
};

} // namespace fedrelay::store
