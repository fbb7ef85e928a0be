#include "faultless/Error.hpp"

#include <magic_enum/magic_enum.hpp>

#include <ostream>
#include <string>

namespace
{
    class FaultlessCategory : public std::error_category
    {
      public:
        const char* name() const noexcept override { return "faultless"; }

        std::string message(int ev) const override
        {
            auto name{ magic_enum::enum_name(static_cast<faultless::Errc>(ev)) };
            if (name.empty()) {
                return "Unknown";
            }
            return std::string(name);
        }
    };

    auto describe(const std::exception_ptr& exception) -> std::string
    {
        if (!exception) {
            return "unknown fault";
        }
        try {
            std::rethrow_exception(exception);
        } catch (const std::exception& ex) {
            return ex.what();
        } catch (...) {
            return "unknown fault";
        }
    }
}

namespace faultless
{
    auto category() noexcept -> const std::error_category&
    {
        static FaultlessCategory instance;
        return instance;
    }

    auto make_error_code(Errc e) noexcept -> std::error_code
    {
        return std::error_code(static_cast<int>(e), category());
    }

    // ---------- MessageError ----------

    MessageError::MessageError(std::string message)
      : m_message(std::move(message))
    {
    }

    auto MessageError::message() const -> std::string { return m_message; }
    auto MessageError::name() const -> std::string_view { return "MessageError"; }
    auto MessageError::code() const -> std::error_code { return make_error_code(Errc::Message); }

    // ---------- CodeError ----------

    CodeError::CodeError(std::error_code code)
      : m_code(code)
    {
    }

    auto CodeError::message() const -> std::string { return m_code.message(); }
    auto CodeError::name() const -> std::string_view { return "CodeError"; }
    auto CodeError::code() const -> std::error_code { return m_code; }

    // ---------- FaultError ----------

    FaultError::FaultError(std::exception_ptr exception)
      : m_exception(std::move(exception))
      , m_message(describe(m_exception))
    {
    }

    auto FaultError::message() const -> std::string { return m_message; }
    auto FaultError::name() const -> std::string_view { return "FaultError"; }
    auto FaultError::code() const -> std::error_code { return make_error_code(Errc::Fault); }

    // ---------- Error ----------

    Error::Error(std::string message)
      : m_payload(std::make_shared<MessageError>(std::move(message)))
    {
    }

    Error::Error(std::string_view message)
      : Error(std::string(message))
    {
    }

    Error::Error(const char* message)
      : Error(std::string(message ? message : ""))
    {
    }

    Error::Error(std::error_code code)
      : m_payload(std::make_shared<CodeError>(code))
    {
    }

    Error::Error(std::shared_ptr<const IError> payload)
      : m_payload(std::move(payload))
    {
        if (!m_payload) {
            m_payload = std::make_shared<MessageError>("empty error");
        }
    }

    auto Error::fromException(std::exception_ptr exception) -> Error
    {
        return Error(FaultError(std::move(exception)));
    }

    auto operator==(const Error& lhs, const Error& rhs) -> bool
    {
        if (lhs.m_payload == rhs.m_payload) {
            return true;
        }
        return lhs.code() == rhs.code() && lhs.message() == rhs.message();
    }

    auto operator<<(std::ostream& os, const Error& error) -> std::ostream&
    {
        return os << error.name() << "(" << error.code().message() << "): " << error.message();
    }

} // namespace faultless
