#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for Pagewise
 */

#include <cstddef>
#include <cstdint>

namespace pagewise {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Reader Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Default number of items fetched per page
constexpr size_t kDefaultPageSize = 10;

/// Default reader name, prefix of its checkpoint keys
constexpr const char* kDefaultReaderName = "PagingItemReader";

// ─────────────────────────────────────────────────────────────────────────────
// Checkpoint Keys
// ─────────────────────────────────────────────────────────────────────────────

/// Suffix of the key holding the number of items read so far
constexpr const char* kReadCountKeySuffix = "read.count";

/// Suffix of the key holding the configured maximum item count
constexpr const char* kReadCountMaxKeySuffix = "read.count.max";

}  // namespace config
}  // namespace pagewise
