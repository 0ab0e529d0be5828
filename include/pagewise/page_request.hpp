#pragma once

/**
 * @file page_request.hpp
 * @brief Parameters of a single page fetch
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pagewise/value.hpp"

namespace pagewise {

/// Reserved parameter carrying the zero-based page index
inline constexpr std::string_view kPageParameter = "_page";

/// Reserved parameter carrying the page size
inline constexpr std::string_view kPageSizeParameter = "_pagesize";

/// Reserved parameter carrying the number of leading rows to skip
inline constexpr std::string_view kSkipRowsParameter = "_skiprows";

/**
 * @brief Request for one page of a paged query
 *
 * Built fresh for every fetch. skip_count() is always
 * page_index() * page_size().
 */
class PageRequest {
public:
    PageRequest(std::string query_id, const ParameterMap* base_parameters,
                uint64_t page_index, size_t page_size);

    [[nodiscard]] const std::string& query_id() const noexcept { return query_id_; }
    [[nodiscard]] uint64_t page_index() const noexcept { return page_index_; }
    [[nodiscard]] size_t page_size() const noexcept { return page_size_; }
    [[nodiscard]] uint64_t skip_count() const noexcept { return page_index_ * page_size_; }

    /**
     * @brief Build the parameter mapping passed to the executor
     *
     * Base parameters are copied first and the reserved paging keys are
     * written after them, so a base parameter named like a reserved key is
     * always overridden by the paging value.
     */
    [[nodiscard]] ParameterMap parameters() const;

    /**
     * @brief Check whether a name is one of the reserved paging keys
     */
    [[nodiscard]] static bool is_reserved(std::string_view name) noexcept;

private:
    std::string query_id_;
    const ParameterMap* base_parameters_;  // not owned, may be null
    uint64_t page_index_;
    size_t page_size_;
};

}  // namespace pagewise
