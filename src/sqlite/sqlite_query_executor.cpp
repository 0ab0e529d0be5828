/**
 * @file sqlite_query_executor.cpp
 * @brief SqliteQueryExecutor implementation
 */

#include "pagewise/sqlite_query_executor.hpp"

#include <sqlite3.h>

#include <utility>

#include "common/logger.hpp"
#include "sqlite/sqlite_statement.hpp"

namespace pagewise {

SqliteQueryExecutor::SqliteQueryExecutor(std::string path,
                                         const SqliteExecutorOptions& options)
    : path_(std::move(path)), options_(options) {}

SqliteQueryExecutor::~SqliteQueryExecutor() {
    close();
}

Status SqliteQueryExecutor::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_locked();
}

Status SqliteQueryExecutor::open_locked() {
    if (db_ != nullptr) {
        return Status::Ok();
    }

    int flags = options_.read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
    if (!options_.read_only && options_.create_if_missing) {
        flags |= SQLITE_OPEN_CREATE;
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path_.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        LOG_ERROR("Failed to open SQLite database {}: {}", path_, message);
        return Status::IOError("Failed to open " + path_ + ": " + message);
    }

    sqlite3_busy_timeout(db, static_cast<int>(options_.busy_timeout_ms));
    db_ = db;
    LOG_INFO("Opened SQLite database: {}", path_);
    return Status::Ok();
}

void SqliteQueryExecutor::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ != nullptr) {
        LOG_INFO("Closing SQLite database: {}", path_);
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool SqliteQueryExecutor::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Status SqliteQueryExecutor::register_query(std::string query_id, std::string sql) {
    if (query_id.empty()) {
        return Status::InvalidArgument("Query id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return Status::IllegalState("Database is not open");
    }

    SqliteStatement stmt;
    Status status = SqliteStatement::prepare(db_, sql, &stmt);
    if (!status.ok()) {
        return Status::InvalidArgument("Invalid SQL for query '" + query_id +
                                       "': " + std::string(status.message()));
    }

    LOG_DEBUG("Registered query '{}': {}", query_id, sql);
    queries_.insert_or_assign(std::move(query_id), std::move(sql));
    return Status::Ok();
}

bool SqliteQueryExecutor::has_query(std::string_view query_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_.find(std::string(query_id)) != queries_.end();
}

Status SqliteQueryExecutor::exec(std::string_view sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return Status::IllegalState("Database is not open");
    }

    const std::string statement(sql);
    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg != nullptr ? errmsg : "sqlite3_exec failed";
        sqlite3_free(errmsg);
        return Status::Execution(message);
    }
    return Status::Ok();
}

Status SqliteQueryExecutor::execute(std::string_view query_id,
                                    const ParameterMap& parameters,
                                    std::vector<Row>* rows) {
    if (rows == nullptr) {
        return Status::InvalidArgument("Output rows must not be null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return Status::IllegalState("Database is not open");
    }

    auto it = queries_.find(std::string(query_id));
    if (it == queries_.end()) {
        return Status::NotFound("Unknown query id: " + std::string(query_id));
    }

    SqliteStatement stmt;
    Status status = SqliteStatement::prepare(db_, it->second, &stmt);
    if (!status.ok()) {
        return Status::Execution(std::string(status.message()));
    }

    status = stmt.bind(parameters);
    if (!status.ok()) {
        return status;
    }

    std::vector<Row> result;
    while (stmt.step()) {
        result.push_back(stmt.row());
    }
    if (!stmt.status().ok()) {
        LOG_ERROR("Query '{}' failed: {}", query_id, stmt.status().to_string());
        return stmt.status();
    }

    *rows = std::move(result);
    return Status::Ok();
}

}  // namespace pagewise
