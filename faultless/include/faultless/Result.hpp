#pragma once

#include "faultless/Error.hpp"

#include <expected>
#include <type_traits>
#include <utility>

namespace faultless
{
    /**
     * @brief Either a value of type T or an Error, discriminated by has_value().
     */
    template<typename T = bool>
    using Result = std::expected<T, Error>;

    namespace detail
    {
        template<typename T>
        struct is_result : std::false_type
        {
        };

        template<typename T>
        struct is_result<std::expected<T, Error>> : std::true_type
        {
        };
    }

    template<typename T>
    concept IsResult = detail::is_result<std::remove_cvref_t<T>>::value;

    template<typename V>
    auto ok(V&& value) -> Result<std::decay_t<V>>
    {
        return Result<std::decay_t<V>>(std::in_place, std::forward<V>(value));
    }

    inline auto ok() -> Result<bool> { return Result<bool>(std::in_place, true); }

    inline auto success() -> Result<void> { return {}; }

    /**
     * @brief Builds the error branch of a Result.
     * Converts to Result<T> for any T, so the value type is picked by the receiving side.
     */
    inline auto error(Error err) -> std::unexpected<Error> { return std::unexpected<Error>(std::move(err)); }

} // namespace faultless
