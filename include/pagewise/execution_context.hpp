#pragma once

/**
 * @file execution_context.hpp
 * @brief Checkpoint state exchanged with the surrounding batch framework
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "pagewise/value.hpp"

namespace pagewise {

/**
 * @brief String-keyed checkpoint store
 *
 * The reader writes its restart position here in update() and reads it
 * back in open(). Persisting the context is the framework's job.
 */
class ExecutionContext {
public:
    ExecutionContext() = default;

    void put(std::string key, Value value);
    void put_int64(std::string key, int64_t value);

    [[nodiscard]] std::optional<Value> get(std::string_view key) const;

    /// Returns nullopt if the key is missing or not an integer
    [[nodiscard]] std::optional<int64_t> get_int64(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    /// @return true if the key was present
    bool remove(std::string_view key);

    void clear();

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Whether anything changed since the last clear_dirty_flag()
    [[nodiscard]] bool is_dirty() const noexcept { return dirty_; }
    void clear_dirty_flag() noexcept { dirty_ = false; }

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

private:
    std::map<std::string, Value, std::less<>> entries_;
    bool dirty_ = false;
};

}  // namespace pagewise
