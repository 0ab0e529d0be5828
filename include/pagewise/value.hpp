#pragma once

/**
 * @file value.hpp
 * @brief Parameter and result value types for Pagewise
 */

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pagewise {

/**
 * @brief A single query parameter or result column value
 */
class Value {
public:
    using ValueType = std::variant<
        std::monostate,  // NULL
        bool,
        int32_t,
        int64_t,
        double,
        std::string
    >;

    /// Construct a NULL value
    Value() : value_(std::monostate{}) {}

    /// Construct from various types
    explicit Value(bool v) : value_(v) {}
    explicit Value(int32_t v) : value_(v) {}
    explicit Value(int64_t v) : value_(v) {}
    explicit Value(double v) : value_(v) {}
    explicit Value(std::string v) : value_(std::move(v)) {}
    explicit Value(const char* v) : value_(std::string(v)) {}

    /// Check if the value is NULL
    [[nodiscard]] bool is_null() const noexcept {
        return std::holds_alternative<std::monostate>(value_);
    }

    /// Type checking methods
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] bool is_int32() const noexcept { return std::holds_alternative<int32_t>(value_); }
    [[nodiscard]] bool is_int64() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }

    /// Value retrieval methods (throw if wrong type)
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int32_t as_int32() const;
    [[nodiscard]] int64_t as_int64() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const;

    /// Safe value retrieval (returns nullopt if wrong type or NULL)
    [[nodiscard]] std::optional<bool> try_bool() const noexcept;
    [[nodiscard]] std::optional<int32_t> try_int32() const noexcept;
    [[nodiscard]] std::optional<int64_t> try_int64() const noexcept;
    [[nodiscard]] std::optional<double> try_double() const noexcept;
    [[nodiscard]] std::optional<std::string_view> try_string() const noexcept;

    /// Convert to string representation
    [[nodiscard]] std::string to_string() const;

    /// Underlying variant, for visitors
    [[nodiscard]] const ValueType& variant() const noexcept { return value_; }

    bool operator==(const Value& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Value& other) const noexcept { return !(*this == other); }

private:
    ValueType value_;
};

/**
 * @brief Named query parameters, ordered by name
 */
using ParameterMap = std::map<std::string, Value, std::less<>>;

/**
 * @brief A single mapped result item
 */
class Row {
public:
    Row() = default;
    explicit Row(std::vector<Value> values, std::vector<std::string> column_names);

    /// Get value by column index
    [[nodiscard]] const Value& operator[](size_t index) const;

    /// Get value by column name
    [[nodiscard]] const Value& operator[](std::string_view name) const;

    /// Get number of columns
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }

    /// Check if row is empty
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept { return column_names_; }

    /// Iterator support
    [[nodiscard]] auto begin() const noexcept { return values_.begin(); }
    [[nodiscard]] auto end() const noexcept { return values_.end(); }

    bool operator==(const Row& other) const noexcept {
        return values_ == other.values_ && column_names_ == other.column_names_;
    }
    bool operator!=(const Row& other) const noexcept { return !(*this == other); }

private:
    std::vector<Value> values_;
    std::vector<std::string> column_names_;
};

}  // namespace pagewise
