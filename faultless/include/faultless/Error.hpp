#pragma once

#include "faultless/Errc.hpp"

#include <reflect>

#include <concepts>
#include <exception>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace faultless
{
    /**
     * @brief Interface of every error payload carried by an Error.
     * The only capability the core relies on is rendering to text.
     */
    class IError
    {
      public:
        virtual ~IError() = default;

        virtual auto message() const -> std::string = 0;
        virtual auto name() const -> std::string_view = 0;
        virtual auto code() const -> std::error_code = 0;
    };

    /**
     * @brief Base for domain specific errors.
     * Derived classes override message() and may carry any extra fields, recoverable via Error::as<Derived>().
     */
    template<typename Derived>
    class StructuredError : public IError
    {
      public:
        auto name() const -> std::string_view override { return reflect::type_name<Derived>(); }
        auto code() const -> std::error_code override { return make_error_code(Errc::Structured); }
    };

    class MessageError final : public IError
    {
      public:
        explicit MessageError(std::string message);

        auto message() const -> std::string override;
        auto name() const -> std::string_view override;
        auto code() const -> std::error_code override;

      private:
        std::string m_message;
    };

    class CodeError final : public IError
    {
      public:
        explicit CodeError(std::error_code code);

        auto message() const -> std::string override;
        auto name() const -> std::string_view override;
        auto code() const -> std::error_code override;

      private:
        std::error_code m_code;
    };

    class FaultError final : public IError
    {
      public:
        explicit FaultError(std::exception_ptr exception);

        auto message() const -> std::string override;
        auto name() const -> std::string_view override;
        auto code() const -> std::error_code override;

        inline auto exception() const noexcept -> const std::exception_ptr& { return m_exception; }

      private:
        std::exception_ptr m_exception;
        std::string m_message;
    };

    template<typename E>
    concept ErrorPayload = std::derived_from<std::remove_cvref_t<E>, IError>;

    /**
     * @brief Immutable, cheaply copyable handle to an error payload.
     */
    class Error
    {
      public:
        Error(std::string message);
        Error(std::string_view message);
        Error(const char* message);
        Error(std::error_code code);

        template<ErrorPayload E>
        Error(E&& payload)
          : m_payload(std::make_shared<std::remove_cvref_t<E>>(std::forward<E>(payload)))
        {
        }

        explicit Error(std::shared_ptr<const IError> payload);

        static auto fromException(std::exception_ptr exception) -> Error;

        auto message() const -> std::string { return m_payload->message(); }
        auto name() const -> std::string_view { return m_payload->name(); }
        auto code() const -> std::error_code { return m_payload->code(); }

        template<ErrorPayload E>
        auto as() const noexcept -> const E*
        {
            return dynamic_cast<const E*>(m_payload.get());
        }

        inline auto payload() const noexcept -> const std::shared_ptr<const IError>& { return m_payload; }

        friend auto operator==(const Error& lhs, const Error& rhs) -> bool;

      private:
        std::shared_ptr<const IError> m_payload;
    };

    auto operator<<(std::ostream& os, const Error& error) -> std::ostream&;

} // namespace faultless
