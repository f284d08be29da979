#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), CELLGA_ASSERT is never compiled out.
 * Use for invariants whose violation is a programming error, never for
 * configuration or input errors (those are reported through Result).
 *
 * Example:
 *   CELLGA_ASSERT(!items.empty(), "choice() requires a non-empty sequence");
 */
#define CELLGA_ASSERT(condition, message)                                                   \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
