/**
 * @file execution_context.cpp
 * @brief ExecutionContext implementation
 */

#include "pagewise/execution_context.hpp"

namespace pagewise {

void ExecutionContext::put(std::string key, Value value) {
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second == value) {
        return;
    }
    entries_.insert_or_assign(std::move(key), std::move(value));
    dirty_ = true;
}

void ExecutionContext::put_int64(std::string key, int64_t value) {
    put(std::move(key), Value(value));
}

std::optional<Value> ExecutionContext::get(std::string_view key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> ExecutionContext::get_int64(std::string_view key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.try_int64();
}

bool ExecutionContext::contains(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

bool ExecutionContext::remove(std::string_view key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    dirty_ = true;
    return true;
}

void ExecutionContext::clear() {
    if (!entries_.empty()) {
        dirty_ = true;
    }
    entries_.clear();
}

}  // namespace pagewise
