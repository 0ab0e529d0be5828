#pragma once

/**
 * @file sqlite_query_executor.hpp
 * @brief QueryExecutor backed by a SQLite connection
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pagewise/query_executor.hpp"
#include "pagewise/status.hpp"
#include "pagewise/value.hpp"

struct sqlite3;

namespace pagewise {

/**
 * @brief Configuration options for opening a SQLite executor
 */
struct SqliteExecutorOptions {
    /// Milliseconds to wait on a locked database (default: 5000)
    uint32_t busy_timeout_ms = 5000;

    /// Open the database read-only (default: false)
    bool read_only = false;

    /// Create the database file if it doesn't exist (default: true)
    bool create_if_missing = true;
};

/**
 * @brief Runs registered SQL statements against a SQLite database
 *
 * Each query id maps to one SQL statement with named parameters
 * (:name, @name or $name). Parameters are bound by name from the
 * mapping passed to execute(); entries the statement does not reference
 * are ignored.
 *
 * Columns are mapped as INTEGER -> int64, REAL -> double,
 * TEXT/BLOB -> string and NULL -> null.
 *
 * Thread Safety:
 * - All calls are serialized on one connection mutex
 */
class SqliteQueryExecutor : public QueryExecutor {
public:
    /**
     * @brief Create an executor; call open() before use
     * @param path Database file path, or ":memory:"
     * @param options Configuration options
     */
    explicit SqliteQueryExecutor(std::string path,
                                 const SqliteExecutorOptions& options = {});

    /**
     * @brief Destructor - closes the connection
     */
    ~SqliteQueryExecutor() override;

    // Non-copyable
    SqliteQueryExecutor(const SqliteQueryExecutor&) = delete;
    SqliteQueryExecutor& operator=(const SqliteQueryExecutor&) = delete;

    /**
     * @brief Open the connection
     */
    [[nodiscard]] Status open();

    /**
     * @brief Close the connection; registered queries are kept
     */
    void close();

    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /**
     * @brief Register or replace the SQL for a query id
     *
     * The connection must be open; the SQL is prepared once to validate it.
     * @return InvalidArgument if the SQL does not prepare
     */
    [[nodiscard]] Status register_query(std::string query_id, std::string sql);

    [[nodiscard]] bool has_query(std::string_view query_id) const;

    /**
     * @brief Run statements outside the paging path (DDL, seed data)
     */
    [[nodiscard]] Status exec(std::string_view sql);

    /**
     * @brief Execute a registered query
     * @return NotFound for an unknown query id, IllegalState when closed,
     *         ExecutionError for a missing parameter or a SQLite failure
     */
    [[nodiscard]] Status execute(std::string_view query_id,
                                 const ParameterMap& parameters,
                                 std::vector<Row>* rows) override;

private:
    Status open_locked();

    std::string path_;
    SqliteExecutorOptions options_;
    sqlite3* db_ = nullptr;
    std::unordered_map<std::string, std::string> queries_;
    mutable std::mutex mutex_;
};

}  // namespace pagewise
