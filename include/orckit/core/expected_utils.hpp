#pragma once

#include "exceptions.hpp"
#include <expected>
#include <format>

/**
 * @brief Assign-or-return helper for std::expected results
 *
 * Usage:
 *   ORCKIT_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define ORCKIT_TRY_ASSIGN(lhs, expr)                                                          \
    do {                                                                                      \
        auto orckit_try_tmp = (expr);                                                         \
        if (!orckit_try_tmp)                                                                  \
            return std::unexpected(orckit_try_tmp.error());                                   \
        lhs = std::move(orckit_try_tmp.value());                                              \
    } while (0)

/**
 * @brief ORCKIT_TRY_VOID macro for void expected results
 *
 * Usage: ORCKIT_TRY_VOID(some_void_expected_result);
 */
#define ORCKIT_TRY_VOID(expr)                                                                 \
    do {                                                                                      \
        auto orckit_try_tmp_void = (expr);                                                    \
        if (!orckit_try_tmp_void)                                                             \
            return std::unexpected(orckit_try_tmp_void.error());                              \
    } while (0)

/**
 * @brief Assign-or-return helper that converts the error into ErrorType with added context
 *
 * Usage:
 *   ORCKIT_TRY_ASSIGN_CTX(value, expr, HexSolverError, "building profile");
 */
#define ORCKIT_TRY_ASSIGN_CTX(lhs, expr, ErrorType, context)                                  \
    do {                                                                                      \
        auto orckit_try_tmp_ctx = (expr);                                                     \
        if (!orckit_try_tmp_ctx) {                                                            \
            return std::unexpected(ErrorType(                                                 \
                std::format("{}: {}", (context), orckit_try_tmp_ctx.error().message())));    \
        }                                                                                     \
        lhs = std::move(orckit_try_tmp_ctx.value());                                          \
    } while (0)
