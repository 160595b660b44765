#pragma once

#include <expected>
#include <utility>

namespace seagas::core {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   SEAGAS_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define SEAGAS_TRY_ASSIGN(lhs, expr)                                                          \
    do {                                                                                      \
        auto seagas_try_tmp = (expr);                                                         \
        if (!seagas_try_tmp)                                                                  \
            return std::unexpected(seagas_try_tmp.error());                                   \
        lhs = std::move(seagas_try_tmp.value());                                              \
    } while (0)

/**
 * @brief SEAGAS_TRY_VOID macro for void expected results
 *
 * Usage: SEAGAS_TRY_VOID(some_void_expected_result);
 */
#define SEAGAS_TRY_VOID(expr)                                                                 \
    do {                                                                                      \
        auto seagas_try_tmp_void = (expr);                                                    \
        if (!seagas_try_tmp_void)                                                             \
            return std::unexpected(seagas_try_tmp_void.error());                              \
    } while (0)

/**
 * @brief Assign-or-return helper that converts the error on the way out
 *
 * Usage:
 *   SEAGAS_TRY_ASSIGN_MAP(value, expr, convert);
 * where convert(error) builds the caller's error type.
 */
#define SEAGAS_TRY_ASSIGN_MAP(lhs, expr, convert)                                             \
    do {                                                                                      \
        auto seagas_try_tmp_map = (expr);                                                     \
        if (!seagas_try_tmp_map)                                                              \
            return std::unexpected(convert(seagas_try_tmp_map.error()));                      \
        lhs = std::move(seagas_try_tmp_map.value());                                          \
    } while (0)

} // namespace seagas::core
