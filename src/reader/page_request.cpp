/**
 * @file page_request.cpp
 * @brief Page parameter construction
 */

#include "pagewise/page_request.hpp"

namespace pagewise {

PageRequest::PageRequest(std::string query_id,
                         const ParameterMap* base_parameters,
                         uint64_t page_index, size_t page_size)
    : query_id_(std::move(query_id)), base_parameters_(base_parameters),
      page_index_(page_index), page_size_(page_size) {}

ParameterMap PageRequest::parameters() const {
    ParameterMap params;
    if (base_parameters_ != nullptr) {
        params = *base_parameters_;
    }

    // Reserved keys go in last and overwrite any colliding base entry
    params.insert_or_assign(std::string(kPageParameter),
                            Value(static_cast<int64_t>(page_index_)));
    params.insert_or_assign(std::string(kPageSizeParameter),
                            Value(static_cast<int64_t>(page_size_)));
    params.insert_or_assign(std::string(kSkipRowsParameter),
                            Value(static_cast<int64_t>(skip_count())));
    return params;
}

bool PageRequest::is_reserved(std::string_view name) noexcept {
    return name == kPageParameter || name == kPageSizeParameter ||
           name == kSkipRowsParameter;
}

}  // namespace pagewise
