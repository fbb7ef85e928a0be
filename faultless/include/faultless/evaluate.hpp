#pragma once

#include "faultless/Result.hpp"
#include "faultless/Sequence.hpp"
#include "faultless/log/Logger.hpp"

#include <concepts>
#include <exception>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>

namespace faultless
{
    namespace detail
    {
        template<typename T>
        struct is_sequence : std::false_type
        {
        };

        template<typename T>
        struct is_sequence<Sequence<T>> : std::true_type
        {
        };

        // Plain value type a producer's output folds into.
        template<typename R>
        struct produced_value
        {
            using type = R;
        };

        template<>
        struct produced_value<void>
        {
            using type = bool;
        };

        template<typename T>
        struct produced_value<Sequence<T>>
        {
            using type = typename Sequence<T>::value_type;
        };

        template<typename T>
        struct produced_value<std::expected<T, Error>>
        {
            using type = T;
        };

        // A bare error() carries no value type; it folds like a void producer.
        template<>
        struct produced_value<std::unexpected<Error>>
        {
            using type = bool;
        };

        template<typename T>
        auto drive(Sequence<T> sequence) -> Result<typename Sequence<T>::value_type>
        {
            while (sequence.next()) {
                if (const auto& failure{ sequence.failure() }) {
                    log::debug("sequence stopped at step {}: {}", sequence.steps(), *failure);
                    return error(*failure);
                }
            }
            return sequence.result();
        }
    }

    template<typename T>
    concept IsSequence = detail::is_sequence<std::remove_cvref_t<T>>::value;

    template<std::invocable Producer>
    using ProducedResult =
      Result<typename detail::produced_value<std::remove_cvref_t<std::invoke_result_t<Producer>>>::type>;

    /**
     * @brief Runs a producer and folds its output into exactly one Result.
     *
     * - a plain value is wrapped with ok(), a void producer yields ok() (true)
     * - a Result is returned unchanged, a bare error() becomes an error Result<bool>
     * - a Sequence is resumed one checkpoint at a time; the first Error or failed Result ends it and is
     *   returned as a fresh error Result. Otherwise the producer's final value is returned, a final
     *   Result unchanged.
     *
     * Exceptions thrown by the producer are contained and returned as an error with code Errc::Fault.
     */
    template<std::invocable Producer>
    auto runSequence(Producer&& producer) -> ProducedResult<Producer>
    {
        using Produced = std::remove_cvref_t<std::invoke_result_t<Producer>>;

        try {
            if constexpr (std::is_void_v<Produced>) {
                std::invoke(std::forward<Producer>(producer));
                return ok();
            }
            else if constexpr (IsSequence<Produced>) {
                return detail::drive(std::invoke(std::forward<Producer>(producer)));
            }
            else if constexpr (IsResult<Produced>) {
                return std::invoke(std::forward<Producer>(producer));
            }
            else if constexpr (std::is_same_v<Produced, std::unexpected<Error>>) {
                return ProducedResult<Producer>{ std::invoke(std::forward<Producer>(producer)) };
            }
            else {
                return ok(std::invoke(std::forward<Producer>(producer)));
            }
        } catch (...) {
            auto fault{ Error::fromException(std::current_exception()) };
            log::warning("fault contained: {}", fault);
            return error(std::move(fault));
        }
    }

} // namespace faultless
