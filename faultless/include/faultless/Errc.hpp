#pragma once

#include <cstdint>
#include <system_error>
#include <type_traits>

namespace faultless
{
    using ErrcType = uint8_t;

    // clang-format off
    enum class Errc : ErrcType
    {
        None = 0,       /**< never carried by an Error */
        Message = 1,    /**< plain message error */
        Structured = 2, /**< user defined structured error */
        Fault = 3       /**< exception contained by runSequence */
    };
    // clang-format on

    auto category() noexcept -> const std::error_category&;
    auto make_error_code(Errc e) noexcept -> std::error_code;

} // namespace faultless

template<>
struct std::is_error_code_enum<faultless::Errc> : std::true_type
{
};
