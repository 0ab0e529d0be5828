#pragma once

/**
 * @file paging_item_reader.hpp
 * @brief Reader that pulls query results one page at a time
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "pagewise/execution_context.hpp"
#include "pagewise/page_buffer.hpp"
#include "pagewise/page_request.hpp"
#include "pagewise/query_executor.hpp"
#include "pagewise/status.hpp"
#include "pagewise/value.hpp"

namespace pagewise {

/**
 * @brief Paging item reader
 *
 * Serves rows one at a time from an in-memory page. When the page is
 * drained the reader re-issues the query for the next page, passing the
 * page index, page size and skip count as reserved parameters, and
 * replaces the buffer with the result. An empty page ends the read.
 *
 * Not safe for concurrent read_next() calls. page_buffer() may be
 * inspected from another thread.
 *
 * Example usage:
 * @code
 * pagewise::PagingItemReader reader;
 * reader.set_query_id("active_users");
 * reader.set_query_executor(executor);
 * reader.set_page_size(100);
 * reader.initialize();
 * std::optional<pagewise::Row> row;
 * while (reader.read_next(&row).ok() && row.has_value()) { ... }
 * @endcode
 */
class PagingItemReader {
public:
    PagingItemReader();
    ~PagingItemReader();

    // Non-copyable
    PagingItemReader(const PagingItemReader&) = delete;
    PagingItemReader& operator=(const PagingItemReader&) = delete;

    // ─────────────────────────────────────────────────────────────────────
    // Configuration (before initialize() only)
    // ─────────────────────────────────────────────────────────────────────

    [[nodiscard]] Status set_name(std::string name);
    [[nodiscard]] Status set_query_id(std::string query_id);
    [[nodiscard]] Status set_query_executor(std::shared_ptr<QueryExecutor> executor);
    [[nodiscard]] Status set_parameter_values(ParameterMap parameters);
    [[nodiscard]] Status set_page_size(size_t page_size);

    /// Stop after this many items; nullopt reads everything
    [[nodiscard]] Status set_max_item_count(std::optional<uint64_t> max_item_count);

    /// Whether update() records, and open() restores, the read position
    [[nodiscard]] Status set_save_state(bool save_state);

    /**
     * @brief Validate configuration
     * @return ConfigurationError if the executor or query id is missing or
     *         the page size is zero
     */
    [[nodiscard]] Status initialize();

    // ─────────────────────────────────────────────────────────────────────
    // Stream lifecycle
    // ─────────────────────────────────────────────────────────────────────

    /**
     * @brief Open for reading, restoring a checkpoint if one is present
     *
     * The read restarts at page 0 and the checkpointed number of items is
     * read and discarded before returning. Items already read without an
     * open() are forgotten.
     */
    [[nodiscard]] Status open(const ExecutionContext& context);

    /**
     * @brief Record the current read position in the context
     */
    [[nodiscard]] Status update(ExecutionContext* context) const;

    /**
     * @brief Reset to page 0 with an empty buffer
     *
     * Configuration is kept; the next read starts over.
     */
    void close();

    // ─────────────────────────────────────────────────────────────────────
    // Reading
    // ─────────────────────────────────────────────────────────────────────

    /**
     * @brief Read the next item
     * @param[out] item The next row, or nullopt at end of data
     * @return Status; executor failures are returned unchanged and the
     *         failed page is fetched again by the next call
     */
    [[nodiscard]] Status read_next(std::optional<Row>* item);

    /**
     * @brief Seek to a page. Not supported; does nothing.
     */
    void jump_to_page(uint64_t page_index);

    [[nodiscard]] static constexpr bool supports_jump_to_page() noexcept { return false; }

    // ─────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────

    /// Index of the next page to fetch
    [[nodiscard]] uint64_t page() const noexcept { return page_; }
    [[nodiscard]] size_t page_size() const noexcept { return page_size_; }

    /// Number of items returned since the last open or close
    [[nodiscard]] uint64_t current_item_count() const noexcept { return item_count_; }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& query_id() const noexcept { return query_id_; }
    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }
    [[nodiscard]] bool is_open() const noexcept { return open_; }
    [[nodiscard]] bool is_exhausted() const noexcept { return exhausted_; }

    [[nodiscard]] const PageBuffer& page_buffer() const noexcept { return buffer_; }

private:
    Status check_configurable(const char* property) const;
    Status fetch_page();
    std::string checkpoint_key(const char* suffix) const;

    // Configuration
    std::string name_;
    std::string query_id_;
    std::shared_ptr<QueryExecutor> executor_;
    ParameterMap parameter_values_;
    size_t page_size_;
    std::optional<uint64_t> max_item_count_;
    bool save_state_ = true;
    bool initialized_ = false;

    // Read state
    PageBuffer buffer_;
    uint64_t page_ = 0;
    uint64_t item_count_ = 0;
    bool exhausted_ = false;
    bool open_ = false;
};

}  // namespace pagewise
