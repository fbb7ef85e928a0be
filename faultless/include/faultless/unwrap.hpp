#pragma once

#include "faultless/Result.hpp"

#include <concepts>
#include <optional>
#include <utility>

namespace faultless
{
    template<typename T>
    struct Unwrapped
    {
        T value{};
        std::optional<Error> error{};
    };

    // Out-slot form: the slot receives std::nullopt on success, the error otherwise.
    // On error the returned value is T{}.

    template<std::default_initializable T>
    auto unwrap(const Result<T>& result, std::optional<Error>& errorSlot) -> T
    {
        if (result.has_value()) {
            errorSlot = std::nullopt;
            return *result;
        }
        errorSlot = result.error();
        return T{};
    }

    template<std::default_initializable T>
    auto unwrap(Result<T>&& result, std::optional<Error>& errorSlot) -> T
    {
        if (result.has_value()) {
            errorSlot = std::nullopt;
            return std::move(*result);
        }
        errorSlot = std::move(result).error();
        return T{};
    }

    inline auto unwrap(const Result<void>& result, std::optional<Error>& errorSlot) -> void
    {
        if (result.has_value()) {
            errorSlot = std::nullopt;
            return;
        }
        errorSlot = result.error();
    }

    // Pair form, meant for structured bindings: auto [value, err] = unwrap(readFile(file, 5));

    template<std::default_initializable T>
    auto unwrap(Result<T> result) -> Unwrapped<T>
    {
        Unwrapped<T> out{};
        out.value = unwrap(std::move(result), out.error);
        return out;
    }

    inline auto unwrap(const Result<void>& result) -> std::optional<Error>
    {
        std::optional<Error> err{};
        unwrap(result, err);
        return err;
    }

} // namespace faultless
