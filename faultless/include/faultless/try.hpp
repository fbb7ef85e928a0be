#pragma once

#include "faultless/Result.hpp"

#include <expected>
#include <utility>

#define FAULTLESS_CONCAT_IMPL(a, b) a##b
#define FAULTLESS_CONCAT(a, b) FAULTLESS_CONCAT_IMPL(a, b)

// Returns the error of `expr` from the enclosing function, which must return a faultless::Result.
#define FAULTLESS_TRY(expr)                                                                                  \
    do {                                                                                                     \
        auto faultless_try_result_ = (expr);                                                                 \
        if (!faultless_try_result_.has_value()) {                                                            \
            return std::unexpected<::faultless::Error>(std::move(faultless_try_result_).error());            \
        }                                                                                                    \
    } while (0)

// FAULTLESS_TRY_ASSIGN(auto file, openFile(path)); declares `file` in the enclosing scope on success.
#define FAULTLESS_TRY_ASSIGN(decl, expr) FAULTLESS_TRY_ASSIGN_IMPL(FAULTLESS_CONCAT(faultless_try_, __LINE__), decl, expr)

#define FAULTLESS_TRY_ASSIGN_IMPL(tmp, decl, expr)                                                           \
    auto tmp = (expr);                                                                                       \
    if (!tmp.has_value()) {                                                                                  \
        return std::unexpected<::faultless::Error>(std::move(tmp).error());                                  \
    }                                                                                                        \
    decl = *std::move(tmp)
