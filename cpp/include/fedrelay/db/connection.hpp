/**
 * @file connection.hpp
 * @brief RAII wrappers over libpq: connection, result, transaction
 */

#pragma once

#include <string>
#include <libpq-fe.h>

namespace fedrelay::db {

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    // Re-establish a dropped connection in place. Returns ok().
    bool reset() {
        if (!conn_) return false;
        PQreset(conn_);
        return ok();
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    bool has_rows() const {
        return res_ && PQresultStatus(res_) == PGRES_TUPLES_OK && PQntuples(res_) > 0;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    bool is_null(int row, int col) const {
        return !res_ || PQgetisnull(res_, row, col);
    }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

private:
    PGresult* res_;
};

inline Result exec(PGconn* conn, const std::string& sql) {
    return Result(PQexec(conn, sql.c_str()));
}

/**
 * RAII transaction. Rolls back on scope exit unless commit() succeeded.
 *
 *   Transaction tx(conn);
 *   if (!tx.ok()) ...
 *   exec(conn, "INSERT ...");
 *   if (!tx.commit()) ...
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn) : conn_(conn) {
        Result res = exec(conn_, "BEGIN");
        begun_ = res.ok();
        if (!begun_) error_ = res.error_message();
    }

    ~Transaction() {
        if (begun_ && !done_) {
            exec(conn_, "ROLLBACK");
        }
    }

    bool ok() const { return begun_; }
    const std::string& error() const { return error_; }

    bool commit() {
        if (!begun_ || done_) return false;
        Result res = exec(conn_, "COMMIT");
        done_ = true;
        if (!res.ok()) {
            error_ = res.error_message();
            return false;
        }
        return true;
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool begun_ = false;
    bool done_ = false;
    std::string error_;
};

} // namespace fedrelay::db
