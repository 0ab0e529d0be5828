#pragma once

/**
 * @file page_buffer.hpp
 * @brief Buffer holding the rows of the most recently fetched page
 *
 * Thread Safety:
 * - Uses shared_mutex so observers may read while the owner drains it
 * - replace()/next()/clear() hold the exclusive lock
 * - Only the owning reader mutates the buffer
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "pagewise/value.hpp"

namespace pagewise {

/**
 * @brief Ordered page rows plus a cursor at the next unread row
 */
class PageBuffer {
public:
    PageBuffer() = default;
    ~PageBuffer() = default;

    PageBuffer(const PageBuffer&) = delete;
    PageBuffer& operator=(const PageBuffer&) = delete;

    /**
     * @brief Discard the current contents and take ownership of a new page
     *
     * The cursor is reset to the first row.
     */
    void replace(std::vector<Row> rows);

    /**
     * @brief Take the row at the cursor and advance
     * @return The row, or nullopt if every row has been read
     */
    [[nodiscard]] std::optional<Row> next();

    /**
     * @brief Drop all rows and reset the cursor
     */
    void clear();

    /**
     * @brief Copy of the buffered rows, safe from any thread
     */
    [[nodiscard]] std::vector<Row> snapshot() const;

    /// Number of rows in the current page
    [[nodiscard]] size_t size() const;

    /// Number of rows not read yet
    [[nodiscard]] size_t remaining() const;

    /// Cursor position within the current page
    [[nodiscard]] size_t position() const;

    [[nodiscard]] bool exhausted() const { return remaining() == 0; }

private:
    mutable std::shared_mutex mutex_;
    std::vector<Row> rows_;
    size_t cursor_ = 0;
};

}  // namespace pagewise
