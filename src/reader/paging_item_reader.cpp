/**
 * @file paging_item_reader.cpp
 * @brief PagingItemReader implementation
 */

#include "pagewise/paging_item_reader.hpp"

#include <utility>
#include <vector>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"

namespace pagewise {

PagingItemReader::PagingItemReader()
    : name_(config::kDefaultReaderName),
      page_size_(config::kDefaultPageSize) {}

PagingItemReader::~PagingItemReader() = default;

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

Status PagingItemReader::check_configurable(const char* property) const {
    if (initialized_) {
        return Status::IllegalState(std::string("Cannot set ") + property +
                                    " after the reader is initialized");
    }
    return Status::Ok();
}

Status PagingItemReader::set_name(std::string name) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("name"));
    name_ = std::move(name);
    return Status::Ok();
}

Status PagingItemReader::set_query_id(std::string query_id) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("query id"));
    query_id_ = std::move(query_id);
    return Status::Ok();
}

Status PagingItemReader::set_query_executor(
    std::shared_ptr<QueryExecutor> executor) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("query executor"));
    executor_ = std::move(executor);
    return Status::Ok();
}

Status PagingItemReader::set_parameter_values(ParameterMap parameters) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("parameter values"));
    for (const auto& [key, value] : parameters) {
        if (PageRequest::is_reserved(key)) {
            LOG_WARN("Parameter '{}' of reader '{}' is reserved and will be "
                     "overridden by the paging value", key, name_);
        }
    }
    parameter_values_ = std::move(parameters);
    return Status::Ok();
}

Status PagingItemReader::set_page_size(size_t page_size) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("page size"));
    page_size_ = page_size;
    return Status::Ok();
}

Status PagingItemReader::set_max_item_count(
    std::optional<uint64_t> max_item_count) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("max item count"));
    max_item_count_ = max_item_count;
    return Status::Ok();
}

Status PagingItemReader::set_save_state(bool save_state) {
    PAGEWISE_RETURN_IF_ERROR(check_configurable("save state"));
    save_state_ = save_state;
    return Status::Ok();
}

Status PagingItemReader::initialize() {
    if (initialized_) {
        return Status::IllegalState("Reader '" + name_ + "' is already initialized");
    }
    if (executor_ == nullptr) {
        return Status::Configuration("A query executor is required");
    }
    if (query_id_.empty()) {
        return Status::Configuration("A query id is required");
    }
    if (page_size_ == 0) {
        return Status::Configuration("Page size must be greater than zero");
    }

    initialized_ = true;
    LOG_DEBUG("Reader '{}' initialized for query '{}' (page size {})", name_,
              query_id_, page_size_);
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Stream lifecycle
// ─────────────────────────────────────────────────────────────────────────────

std::string PagingItemReader::checkpoint_key(const char* suffix) const {
    return name_ + "." + suffix;
}

Status PagingItemReader::open(const ExecutionContext& context) {
    if (!initialized_) {
        return Status::IllegalState("Reader '" + name_ +
                                    "' must be initialized before open");
    }
    if (open_) {
        return Status::IllegalState(
            "Cannot open an already opened reader, call close first");
    }

    close();
    open_ = true;

    if (!save_state_) {
        return Status::Ok();
    }

    auto max = context.get_int64(checkpoint_key(config::kReadCountMaxKeySuffix));
    if (max.has_value() && *max >= 0) {
        max_item_count_ = static_cast<uint64_t>(*max);
    }

    auto count = context.get_int64(checkpoint_key(config::kReadCountKeySuffix));
    if (!count.has_value() || *count == 0) {
        return Status::Ok();
    }
    if (*count < 0) {
        close();
        return Status::InvalidArgument("Negative read count in checkpoint: " +
                                       std::to_string(*count));
    }

    const auto restored = static_cast<uint64_t>(*count);
    if (max_item_count_.has_value() && restored > *max_item_count_) {
        close();
        return Status::IllegalState(
            "The current item count is greater than the max item count");
    }

    // No seek support: start over from page 0 and discard what was consumed
    LOG_INFO("Restarting reader '{}' at item {} by re-reading from page 0",
             name_, restored);
    std::optional<Row> skipped;
    while (item_count_ < restored) {
        Status status = read_next(&skipped);
        if (!status.ok()) {
            close();
            return status;
        }
        if (!skipped.has_value()) {
            LOG_WARN("Reader '{}' reached end of data after {} of {} restored "
                     "items", name_, item_count_, restored);
            break;
        }
    }
    return Status::Ok();
}

Status PagingItemReader::update(ExecutionContext* context) const {
    if (context == nullptr) {
        return Status::InvalidArgument("Execution context must not be null");
    }
    if (!save_state_) {
        return Status::Ok();
    }

    context->put_int64(checkpoint_key(config::kReadCountKeySuffix),
                       static_cast<int64_t>(item_count_));
    if (max_item_count_.has_value()) {
        context->put_int64(checkpoint_key(config::kReadCountMaxKeySuffix),
                           static_cast<int64_t>(*max_item_count_));
    }
    return Status::Ok();
}

void PagingItemReader::close() {
    if (open_) {
        LOG_INFO("Closing reader '{}' after {} items", name_, item_count_);
    }
    buffer_.clear();
    page_ = 0;
    item_count_ = 0;
    exhausted_ = false;
    open_ = false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────────────────────────────────────

Status PagingItemReader::read_next(std::optional<Row>* item) {
    if (item == nullptr) {
        return Status::InvalidArgument("Output item must not be null");
    }
    if (!initialized_) {
        return Status::IllegalState("Reader '" + name_ +
                                    "' must be initialized before reading");
    }
    item->reset();

    if (exhausted_) {
        return Status::Ok();
    }
    if (max_item_count_.has_value() && item_count_ >= *max_item_count_) {
        return Status::Ok();
    }

    auto row = buffer_.next();
    if (!row.has_value()) {
        PAGEWISE_RETURN_IF_ERROR(fetch_page());
        if (exhausted_) {
            return Status::Ok();
        }
        row = buffer_.next();
    }

    ++item_count_;
    *item = std::move(row);
    return Status::Ok();
}

Status PagingItemReader::fetch_page() {
    PageRequest request(query_id_, &parameter_values_, page_, page_size_);
    LOG_DEBUG("Reading page {} of query '{}' (page size {}, skip {})",
              request.page_index(), request.query_id(), request.page_size(),
              request.skip_count());

    std::vector<Row> rows;
    Status status =
        executor_->execute(request.query_id(), request.parameters(), &rows);
    if (!status.ok()) {
        // page_ stays put so a retry asks for the same page
        LOG_WARN("Reading page {} of query '{}' failed: {}",
                 request.page_index(), request.query_id(), status.to_string());
        return status;
    }

    ++page_;
    if (rows.empty()) {
        buffer_.clear();
        exhausted_ = true;
        LOG_INFO("Reader '{}' reached end of data after {} items", name_,
                 item_count_);
        return Status::Ok();
    }

    LOG_DEBUG("Page {} of query '{}' returned {} rows", request.page_index(),
              request.query_id(), rows.size());
    buffer_.replace(std::move(rows));
    return Status::Ok();
}

void PagingItemReader::jump_to_page(uint64_t page_index) {
    LOG_WARN("Reader '{}' does not support jumping to page {}, ignoring",
             name_, page_index);
}

}  // namespace pagewise
