#pragma once

/**
 * @file sqlite_statement.hpp
 * @brief RAII wrapper around a prepared SQLite statement
 */

#include <sqlite3.h>

#include <string>
#include <string_view>

#include "common/macros.hpp"
#include "pagewise/status.hpp"
#include "pagewise/value.hpp"

namespace pagewise {

/**
 * @brief Owns a sqlite3_stmt and finalizes it on destruction
 *
 * Rows are stepped one at a time; step() reports whether a row is
 * available and leaves any error in status().
 */
class SqliteStatement {
public:
    SqliteStatement() = default;
    ~SqliteStatement();

    PAGEWISE_DISALLOW_COPY(SqliteStatement);

    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    /**
     * @brief Prepare a single statement
     */
    [[nodiscard]] static Status prepare(sqlite3* db, std::string_view sql,
                                        SqliteStatement* out);

    /**
     * @brief Bind every named parameter of the statement from a mapping
     * @return ExecutionError naming the first parameter with no value
     */
    [[nodiscard]] Status bind(const ParameterMap& parameters);

    /**
     * @brief Advance to the next row
     * @return true if a row is available
     */
    [[nodiscard]] bool step();

    /// Error from the last step(), OK when the result was SQLITE_DONE
    [[nodiscard]] const Status& status() const noexcept { return status_; }

    /// Map the current row
    [[nodiscard]] Row row() const;

    [[nodiscard]] int column_count() const;

    void finalize();

private:
    explicit SqliteStatement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Status bind_value(int index, const Value& value);
    Value column_value(int index) const;

    sqlite3_stmt* stmt_ = nullptr;
    Status status_;
};

}  // namespace pagewise
