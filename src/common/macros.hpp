#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for Pagewise
 */

#include <cassert>
#include <cstdlib>
#include <iostream>

namespace pagewise {

// ─────────────────────────────────────────────────────────────────────────────
// Assertion Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Assert that a condition is true (debug builds only)
 */
#ifdef NDEBUG
#define PAGEWISE_ASSERT(condition, message) ((void)0)
#else
#define PAGEWISE_ASSERT(condition, message)                                   \
    do {                                                                      \
        if (!(condition)) {                                                   \
            std::cerr << "Assertion failed: " << #condition << "\n"           \
                      << "Message: " << (message) << "\n"                     \
                      << "File: " << __FILE__ << "\n"                         \
                      << "Line: " << __LINE__ << std::endl;                   \
            std::abort();                                                     \
        }                                                                     \
    } while (false)
#endif

// ─────────────────────────────────────────────────────────────────────────────
// Utility Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Disable copy constructor and assignment
 */
#define PAGEWISE_DISALLOW_COPY(ClassName)          \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

}  // namespace pagewise
