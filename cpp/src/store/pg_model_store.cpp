#include "fedrelay/store/pg_model_store.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"

#include <boost/json.hpp>

#include <cctype>
#include <cstdlib>

namespace fedrelay::store {

namespace {

bool valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

std::string headers_json(const Headers& headers) {
    boost::json::object obj;
    for (const auto& [name, value] : headers) {
        obj[name] = value;
    }
    return boost::json::serialize(obj);
}

} // namespace

PgModelStore::PgModelStore(const std::string& conninfo, std::string table)
    : conn_(conninfo), table_(std::move(table)) {
    if (!valid_identifier(table_)) {
        throw InvalidParameterError("Invalid table name '" + table_ + "'", "PgModelStore");
    }
    if (!conn_.ok()) {
        throw StorageReadError(std::string("Failed to connect: ") + conn_.error(), "PgModelStore");
    }
}

void PgModelStore::ensure_connected() {
    if (conn_.ok()) return;
    LOG_WARN("PostgreSQL connection lost, resetting");
    if (!conn_.reset()) {
        throw StorageReadError(std::string("Reconnect failed: ") + conn_.error(), "PgModelStore");
    }
}

void PgModelStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    const std::string sql =
        "CREATE TABLE IF NOT EXISTS " + table_ + " ("
        "  key        TEXT PRIMARY KEY,"
        "  payload    BYTEA NOT NULL,"
        "  headers    JSONB NOT NULL DEFAULT '{}'::jsonb,"
        "  version    BIGINT NOT NULL DEFAULT 1,"
        "  updated_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ")";
    db::Result res = db::exec(conn_, sql);
    if (!res.ok()) {
        throw FedRelayException(ErrorCode::STORAGE_WRITE_FAILURE,
                                "Schema creation failed: " + res.error_message(), "PgModelStore");
    }
}

FetchResult PgModelStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    const std::string sql = "SELECT payload FROM " + table_ + " WHERE key = $1";
    const char* params[1] = {key.c_str()};
    // Binary result format so bytea arrives as raw bytes.
    db::Result res(PQexecParams(conn_, sql.c_str(), 1, nullptr, params, nullptr, nullptr, 1));
    if (!res.ok()) {
        throw StorageReadError("SELECT failed: " + res.error_message(), "PgModelStore");
    }
    if (!res.has_rows() || res.is_null(0, 0)) {
        return FetchResult::not_found(0);
    }

    const auto* data = reinterpret_cast<const uint8_t*>(PQgetvalue(res.get(), 0, 0));
    const int len = PQgetlength(res.get(), 0, 0);
    return FetchResult::with_bytes(Bytes(data, data + len), 0);
}

PutResult PgModelStore::put(const std::string& key, const Bytes& bytes, const Headers& headers) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    const std::string sql =
        "INSERT INTO " + table_ + " (key, payload, headers) VALUES ($1, $2, $3::jsonb) "
        "ON CONFLICT (key) DO UPDATE SET payload = EXCLUDED.payload, headers = EXCLUDED.headers, "
        "version = " + table_ + ".version + 1, updated_at = now() "
        "RETURNING version";

    const std::string meta = headers_json(headers);
    const char* values[3] = {key.c_str(), reinterpret_cast<const char*>(bytes.data()), meta.c_str()};
    const int lengths[3] = {0, static_cast<int>(bytes.size()), 0};
    const int formats[3] = {0, 1, 0};

    db::Transaction tx(conn_);
    if (!tx.ok()) {
        return PutResult::failure(500, "BEGIN failed: " + tx.error());
    }

    db::Result res(PQexecParams(conn_, sql.c_str(), 3, nullptr, values, lengths, formats, 0));
    if (!res.ok() || !res.has_rows()) {
        return PutResult::failure(500, "Upsert failed: " + res.error_message());
    }
    const std::string version = PQgetvalue(res.get(), 0, 0);

    if (!tx.commit()) {
        return PutResult::failure(500, "COMMIT failed: " + tx.error());
    }
    return PutResult::success("postgres://" + table_ + "/" + key + "#v" + version, 200);
}

int64_t PgModelStore::version(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    const std::string sql = "SELECT version FROM " + table_ + " WHERE key = $1";
    const char* params[1] = {key.c_str()};
    db::Result res(PQexecParams(conn_, sql.c_str(), 1, nullptr, params, nullptr, nullptr, 0));
    if (!res.ok()) {
        throw StorageReadError("SELECT version failed: " + res.error_message(), "PgModelStore");
    }
    if (!res.has_rows()) {
        return 0;
    }
    return std::strtoll(PQgetvalue(res.get(), 0, 0), nullptr, 10);
}

void PgModelStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    const std::string sql = "DELETE FROM " + table_ + " WHERE key = $1";
    const char* params[1] = {key.c_str()};
    db::Result res(PQexecParams(conn_, sql.c_str(), 1, nullptr, params, nullptr, nullptr, 0));
    if (!res.ok()) {
        throw FedRelayException(ErrorCode::STORAGE_WRITE_FAILURE,
                                "DELETE failed: " + res.error_message(), "PgModelStore");
    }
}

std::string PgModelStore::describe() const {
    return "postgres://" + table_;
}

} // namespace fedrelay::store
