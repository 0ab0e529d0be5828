/**
 * @file sqlite_statement.cpp
 * @brief SqliteStatement implementation
 */

#include "sqlite/sqlite_statement.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace pagewise {

SqliteStatement::~SqliteStatement() {
    finalize();
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : stmt_(other.stmt_), status_(std::move(other.status_)) {
    other.stmt_ = nullptr;
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        finalize();
        stmt_ = other.stmt_;
        status_ = std::move(other.status_);
        other.stmt_ = nullptr;
    }
    return *this;
}

Status SqliteStatement::prepare(sqlite3* db, std::string_view sql,
                                SqliteStatement* out) {
    if (db == nullptr) {
        return Status::IllegalState("Database is not open");
    }

    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.data(),
                                      static_cast<int>(sql.size()), &stmt, &tail);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Status::Execution(sqlite3_errmsg(db));
    }
    if (stmt == nullptr) {
        return Status::InvalidArgument("SQL contains no statement");
    }

    // Only one statement per query; anything after it is rejected
    const char* end = sql.data() + sql.size();
    for (const char* p = tail; p != nullptr && p < end; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p)) && *p != ';') {
            sqlite3_finalize(stmt);
            return Status::InvalidArgument("SQL contains more than one statement");
        }
    }

    *out = SqliteStatement(stmt);
    return Status::Ok();
}

Status SqliteStatement::bind(const ParameterMap& parameters) {
    const int count = sqlite3_bind_parameter_count(stmt_);
    for (int i = 1; i <= count; ++i) {
        const char* raw = sqlite3_bind_parameter_name(stmt_, i);
        // Anonymous (?) and numbered (?NNN) parameters have no usable name
        if (raw == nullptr || raw[0] == '?') {
            return Status::Execution("Positional parameter " + std::to_string(i) +
                                     " is not supported, use a named parameter");
        }

        // Strip the ':', '@' or '$' prefix
        std::string_view name(raw + 1);
        auto it = parameters.find(name);
        if (it == parameters.end()) {
            return Status::Execution("No value for parameter '" +
                                     std::string(name) + "'");
        }

        Status status = bind_value(i, it->second);
        if (!status.ok()) {
            return status;
        }
    }
    return Status::Ok();
}

Status SqliteStatement::bind_value(int index, const Value& value) {
    const auto& v = value.variant();
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::monostate>(v)) {
        rc = sqlite3_bind_null(stmt_, index);
    } else if (auto* b = std::get_if<bool>(&v)) {
        rc = sqlite3_bind_int(stmt_, index, *b ? 1 : 0);
    } else if (auto* i32 = std::get_if<int32_t>(&v)) {
        rc = sqlite3_bind_int(stmt_, index, *i32);
    } else if (auto* i64 = std::get_if<int64_t>(&v)) {
        rc = sqlite3_bind_int64(stmt_, index, *i64);
    } else if (auto* d = std::get_if<double>(&v)) {
        rc = sqlite3_bind_double(stmt_, index, *d);
    } else if (auto* s = std::get_if<std::string>(&v)) {
        rc = sqlite3_bind_text(stmt_, index, s->data(),
                               static_cast<int>(s->size()), SQLITE_TRANSIENT);
    }

    if (rc != SQLITE_OK) {
        return Status::Execution(sqlite3_errmsg(sqlite3_db_handle(stmt_)));
    }
    return Status::Ok();
}

bool SqliteStatement::step() {
    if (stmt_ == nullptr) {
        status_ = Status::IllegalState("Statement is not prepared");
        return false;
    }

    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        status_ = Status::Ok();
    } else if (rc == SQLITE_BUSY) {
        status_ = Status::Execution(std::string("Database is busy: ") +
                                    sqlite3_errmsg(sqlite3_db_handle(stmt_)));
    } else {
        status_ = Status::Execution(sqlite3_errmsg(sqlite3_db_handle(stmt_)));
    }
    return false;
}

int SqliteStatement::column_count() const {
    return stmt_ != nullptr ? sqlite3_column_count(stmt_) : 0;
}

Row SqliteStatement::row() const {
    const int count = column_count();
    std::vector<Value> values;
    std::vector<std::string> names;
    values.reserve(count);
    names.reserve(count);

    for (int i = 0; i < count; ++i) {
        const char* name = sqlite3_column_name(stmt_, i);
        names.emplace_back(name != nullptr ? name : "");
        values.push_back(column_value(i));
    }
    return Row(std::move(values), std::move(names));
}

Value SqliteStatement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_column_int64(stmt_, index)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt_, index));
        case SQLITE_TEXT: {
            const auto* text = sqlite3_column_text(stmt_, index);
            const int bytes = sqlite3_column_bytes(stmt_, index);
            if (text == nullptr) {
                return Value(std::string());
            }
            return Value(std::string(reinterpret_cast<const char*>(text),
                                     static_cast<size_t>(bytes)));
        }
        case SQLITE_BLOB: {
            const void* blob = sqlite3_column_blob(stmt_, index);
            const int bytes = sqlite3_column_bytes(stmt_, index);
            if (blob == nullptr) {
                return Value(std::string());
            }
            return Value(std::string(static_cast<const char*>(blob),
                                     static_cast<size_t>(bytes)));
        }
        default:
            return Value();
    }
}

void SqliteStatement::finalize() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

}  // namespace pagewise
