#pragma once

/**
 * @file pagewise.hpp
 * @brief Main include header for Pagewise
 *
 * Include this single header to access the public API of Pagewise.
 */

#include "pagewise/execution_context.hpp"
#include "pagewise/page_buffer.hpp"
#include "pagewise/page_request.hpp"
#include "pagewise/paging_item_reader.hpp"
#include "pagewise/query_executor.hpp"
#include "pagewise/sqlite_query_executor.hpp"
#include "pagewise/status.hpp"
#include "pagewise/value.hpp"

namespace pagewise {

/**
 * @brief Get the version string of Pagewise
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

/**
 * @brief Get the major version number
 */
constexpr int version_major() noexcept {
    return 0;
}

/**
 * @brief Get the minor version number
 */
constexpr int version_minor() noexcept {
    return 1;
}

/**
 * @brief Get the patch version number
 */
constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace pagewise
