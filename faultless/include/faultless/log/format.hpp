#pragma once

#include "faultless/Error.hpp"
#include "faultless/Result.hpp"

#include <reflect>

#include <algorithm>
#include <expected>
#include <format>
#include <optional>
#include <string_view>
#include <type_traits>

namespace faultless::log::format::detail
{
    template<typename T>
    concept ScopedEnum = std::is_scoped_enum_v<std::remove_cvref_t<T>>;

    // Accepts an empty spec or the single flag character `Flag`.
    template<char Flag, typename Ctx>
    constexpr auto parse_flag(Ctx& ctx, bool& flag) -> typename Ctx::iterator
    {
        auto it{ ctx.begin() };
        if (it == ctx.end()) {
            return it;
        }

        if (*it == Flag) {
            flag = true;
            ++it;
        }

        if (it != ctx.end() && *it != '}') {
            throw std::format_error("Invalid format args");
        }

        return it;
    }
}

template<faultless::log::format::detail::ScopedEnum T>
struct std::formatter<T>
{
    bool verbose{ false };

    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        return faultless::log::format::detail::parse_flag<'v'>(ctx, verbose);
    }

    template<typename Ctx>
    auto format(T t, Ctx& ctx) const -> Ctx::iterator
    {
        if (verbose) {
            return std::format_to(ctx.out(), "{}:{}", reflect::type_name(t), reflect::enum_name(t));
        }
        return std::format_to(ctx.out(), "{}", reflect::enum_name(t));
    }
};

// {} -> message, {:v} -> Name(code): message
template<>
struct std::formatter<faultless::Error>
{
    bool verbose{ false };

    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        return faultless::log::format::detail::parse_flag<'v'>(ctx, verbose);
    }

    template<typename Ctx>
    auto format(const faultless::Error& error, Ctx& ctx) const -> Ctx::iterator
    {
        if (verbose) {
            return std::format_to(
              ctx.out(), "{}({}): {}", error.name(), error.code().message(), error.message());
        }
        return std::format_to(ctx.out(), "{}", error.message());
    }
};

template<>
struct std::formatter<std::optional<faultless::Error>> : std::formatter<faultless::Error>
{
    using Base = std::formatter<faultless::Error>;

    template<typename Ctx>
    auto format(const std::optional<faultless::Error>& error, Ctx& ctx) const -> Ctx::iterator
    {
        using namespace std::string_view_literals;
        if (!error) {
            return std::ranges::copy("[ no error ]"sv, ctx.out()).out;
        }
        return Base::format(*error, ctx);
    }
};

template<std::formattable<char> T>
struct std::formatter<std::expected<T, faultless::Error>> : std::formatter<T>
{
    using Base = std::formatter<T>;

    template<typename Ctx>
    auto format(const std::expected<T, faultless::Error>& result, Ctx& ctx) const -> Ctx::iterator
    {
        using namespace std::string_view_literals;
        if (!result) {
            return std::format_to(ctx.out(), "[ error: {} ]", result.error());
        }

        ctx.advance_to(std::ranges::copy("[ ok: "sv, ctx.out()).out);
        ctx.advance_to(Base::format(*result, ctx));
        return std::ranges::copy(" ]"sv, ctx.out()).out;
    }
};

template<>
struct std::formatter<std::expected<void, faultless::Error>>
{
    template<typename Ctx>
    constexpr auto parse(Ctx& ctx) -> Ctx::iterator
    {
        return ctx.begin();
    }

    template<typename Ctx>
    auto format(const std::expected<void, faultless::Error>& result, Ctx& ctx) const -> Ctx::iterator
    {
        if (!result) {
            return std::format_to(ctx.out(), "[ error: {} ]", result.error());
        }
        return std::format_to(ctx.out(), "[ ok ]");
    }
};
