#pragma once

#include "faultless/Result.hpp"

#include <concepts>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <expected>
#include <optional>
#include <type_traits>
#include <utility>

namespace faultless
{
    namespace detail
    {
        template<typename T>
        struct SequencePromise;
    }

    /**
     * @brief Coroutine return type of a lazy, cooperatively produced sequence of checkpoints.
     *
     * The producer starts suspended and runs only when next() is called. Every co_yield hands one
     * checkpoint to the consumer: an Error (or anything convertible to one) or a Result<U>. A successful
     * Result yields its value back into the producer, so `auto file = co_yield openFile(path);` reads
     * like a checked call. Once a failed checkpoint has been observed the producer is never resumed again.
     *
     * Sequence<void> producers finish without a value, their final Result holds `true`.
     */
    template<typename T = void>
    class Sequence
    {
        static_assert(!IsResult<T>, "co_return accepts Result<T> directly, declare the producer as Sequence<T>");

      public:
        using promise_type = detail::SequencePromise<T>;
        using handle_type = std::coroutine_handle<promise_type>;
        using value_type = std::conditional_t<std::is_void_v<T>, bool, T>;

        explicit Sequence(handle_type handle)
          : m_handle(handle)
        {
        }
        ~Sequence()
        {
            if (m_handle) {
                m_handle.destroy();
            }
        }

        Sequence(const Sequence&) = delete;
        auto operator=(const Sequence&) -> Sequence& = delete;

        Sequence(Sequence&& other) noexcept
          : m_handle(std::exchange(other.m_handle, nullptr))
        {
        }
        auto operator=(Sequence&& other) noexcept -> Sequence&
        {
            if (this != &other) {
                if (m_handle) {
                    m_handle.destroy();
                }
                m_handle = std::exchange(other.m_handle, nullptr);
            }
            return *this;
        }

        // Resumes the producer up to its next checkpoint. Returns false once the producer has
        // finished or a failed checkpoint was already seen. Exceptions escaping the producer are rethrown.
        auto next() -> bool
        {
            if (!m_handle || m_handle.done() || m_handle.promise().failure) {
                return false;
            }

            m_handle.resume();
            if (m_handle.promise().exception) {
                std::rethrow_exception(std::exchange(m_handle.promise().exception, nullptr));
            }
            return !m_handle.done();
        }

        inline auto failure() const -> const std::optional<Error>& { return m_handle.promise().failure; }
        inline auto steps() const noexcept -> size_t { return m_handle ? m_handle.promise().steps : 0; }
        inline auto done() const noexcept -> bool { return !m_handle || m_handle.done(); }

        // Final value of an exhausted producer.
        auto result() -> Result<value_type>
        {
            if (!m_handle || !m_handle.done()) {
                return error("sequence has not finished");
            }

            if constexpr (std::is_void_v<T>) {
                return ok();
            }
            else {
                if (!m_handle.promise().returned) {
                    return error("sequence finished without a value");
                }
                return std::move(*m_handle.promise().returned);
            }
        }

      private:
        handle_type m_handle;
    };

    namespace detail
    {
        // The yielded Result lives in the coroutine frame until the co_yield full expression ends,
        // so the awaiter can hand its value back on resumption.
        template<typename U, bool Move>
        struct CheckpointAwaiter
        {
            using Item = std::conditional_t<Move, Result<U>, const Result<U>>;
            Item* item;

            auto await_ready() const noexcept -> bool { return false; }
            auto await_suspend(std::coroutine_handle<>) const noexcept -> void {}
            auto await_resume() const -> U
            {
                if constexpr (std::is_void_v<U>) {
                    return;
                }
                else if constexpr (Move) {
                    return std::move(**item);
                }
                else {
                    return **item;
                }
            }
        };

        struct SequencePromiseBase
        {
            std::optional<Error> failure;
            std::exception_ptr exception;
            size_t steps{ 0 };

            auto initial_suspend() -> std::suspend_always { return {}; }
            auto final_suspend() noexcept -> std::suspend_always { return {}; }
            auto unhandled_exception() -> void { exception = std::current_exception(); }

            auto yield_value(Error err) -> std::suspend_always
            {
                ++steps;
                failure = std::move(err);
                return {};
            }

            auto yield_value(std::unexpected<Error> err) -> std::suspend_always
            {
                ++steps;
                failure = std::move(err).error();
                return {};
            }

            template<typename U>
            auto yield_value(Result<U>&& item) -> CheckpointAwaiter<U, true>
            {
                ++steps;
                if (!item.has_value()) {
                    failure = item.error();
                }
                return { &item };
            }

            template<typename U>
            auto yield_value(const Result<U>& item) -> CheckpointAwaiter<U, false>
            {
                ++steps;
                if (!item.has_value()) {
                    failure = item.error();
                }
                return { &item };
            }
        };

        template<typename T>
        struct SequencePromise : public SequencePromiseBase
        {
            std::optional<Result<T>> returned;

            auto get_return_object() -> Sequence<T>
            {
                return Sequence<T>{ Sequence<T>::handle_type::from_promise(*this) };
            }

            template<typename U = T>
                requires(!IsResult<U> && std::convertible_to<U &&, T>)
            auto return_value(U&& value) -> void
            {
                returned.emplace(std::in_place, std::forward<U>(value));
            }

            template<typename U>
                requires(IsResult<U> && std::constructible_from<Result<T>, U &&>)
            auto return_value(U&& result) -> void
            {
                returned.emplace(std::forward<U>(result));
            }

            auto return_value(std::unexpected<Error> err) -> void { returned.emplace(std::move(err)); }
        };

        template<>
        struct SequencePromise<void> : public SequencePromiseBase
        {
            auto get_return_object() -> Sequence<void>
            {
                return Sequence<void>{ Sequence<void>::handle_type::from_promise(*this) };
            }

            auto return_void() -> void {}
        };
    }

} // namespace faultless
