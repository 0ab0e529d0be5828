/**
 * @file page_buffer.cpp
 * @brief PageBuffer implementation
 */

#include "pagewise/page_buffer.hpp"

#include "common/macros.hpp"

namespace pagewise {

void PageBuffer::replace(std::vector<Row> rows) {
    std::unique_lock lock(mutex_);
    rows_ = std::move(rows);
    cursor_ = 0;
}

std::optional<Row> PageBuffer::next() {
    std::unique_lock lock(mutex_);
    if (cursor_ >= rows_.size()) {
        return std::nullopt;
    }
    // Copy rather than move so observers still see the whole page
    return rows_[cursor_++];
}

void PageBuffer::clear() {
    std::unique_lock lock(mutex_);
    rows_.clear();
    cursor_ = 0;
}

std::vector<Row> PageBuffer::snapshot() const {
    std::shared_lock lock(mutex_);
    return rows_;
}

size_t PageBuffer::size() const {
    std::shared_lock lock(mutex_);
    return rows_.size();
}

size_t PageBuffer::remaining() const {
    std::shared_lock lock(mutex_);
    PAGEWISE_ASSERT(cursor_ <= rows_.size(), "page buffer cursor past end");
    return rows_.size() - cursor_;
}

size_t PageBuffer::position() const {
    std::shared_lock lock(mutex_);
    return cursor_;
}

}  // namespace pagewise
