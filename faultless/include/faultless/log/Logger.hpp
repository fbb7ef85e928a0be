#pragma once

#include "faultless/Result.hpp"
#include "faultless/log/format.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <print>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace faultless::log
{
    struct FunctionInfo
    {
        std::string_view full_name{};
        std::string_view short_name{};
        std::string_view parameter_list{};
    };

    namespace detail
    {
        // "auto ns::Class::fn(int, char) const" -> full "ns::Class::fn", short "fn", parameters "int, char"
        constexpr auto parseFunctionName(std::string_view function_name) -> FunctionInfo
        {
            FunctionInfo info{};

            auto open{ function_name.find('(') };
            if (function_name.empty() || open == std::string_view::npos) {
                return info;
            }

            auto close{ function_name.find(')', open) };
            if (close != std::string_view::npos) {
                info.parameter_list = function_name.substr(open + 1, close - open - 1);
            }

            auto head{ function_name.substr(0, open) };
            auto name_start{ head.rfind(' ') };
            info.full_name = name_start == std::string_view::npos ? head : head.substr(name_start + 1);

            info.short_name = info.full_name;
            if (auto last{ info.full_name.rfind(':') }; last != std::string_view::npos) {
                info.short_name = info.full_name.substr(last + 1);
            }

            return info;
        }

        static_assert(parseFunctionName("void test()").full_name == "test");
        static_assert(parseFunctionName("int ns::Widget::run(int, char) const").short_name == "run");
        static_assert(parseFunctionName("int ns::Widget::run(int, char) const").full_name == "ns::Widget::run");
        static_assert(parseFunctionName("int ns::Widget::run(int, char) const").parameter_list == "int, char");
        static_assert(parseFunctionName("MyClass()").full_name == "MyClass");
        static_assert(parseFunctionName("").full_name.empty());
    }

    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    auto parseLevel(std::string_view name) -> Result<Level>;

    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        Level level;
        std::string message;
        std::thread::id threadId;
        std::string file;
        uint32_t line;
        FunctionInfo function;
    };

    struct LoggerConfig
    {
        Level minLevel{ Level::Info };
        bool showTimestamp{ true };
        std::string timestampFormat{ "{:%Y-%m-%d %H:%M:%S}" };
        bool showLevel{ true };
        bool showThreadId{ false };
        bool showFile{ false };
        bool showLine{ false };
        bool showFunction{ false };

        // Defaults, with minLevel taken from FAULTLESS_LOG_LEVEL when set.
        static auto fromEnvironment() -> Result<LoggerConfig>;
    };

    template<typename... Args>
    struct FormatString
    {
        std::format_string<Args...> str;
        std::source_location loc;
        FunctionInfo function;

        template<typename T>
            requires std::convertible_to<const T&, std::string_view>
        consteval FormatString(const T& s, std::source_location l = std::source_location::current())
          : str(s)
          , loc(l)
          , function(detail::parseFunctionName(l.function_name()))
        {
        }
    };

    class Logger
    {
      public:
        using Sink = std::function<void(const LogEntry&)>;

        static auto instance() -> Logger&
        {
            static Logger logger;
            return logger;
        }

        Logger() = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        auto setConfig(LoggerConfig config) -> void
        {
            std::lock_guard lock(m_mutex);
            m_config = std::move(config);
        }

        auto config() const -> LoggerConfig
        {
            std::lock_guard lock(m_mutex);
            return m_config;
        }

        // Replaces the default stdout/stderr printer. An empty sink restores it.
        auto setSink(Sink sink) -> void
        {
            std::lock_guard lock(m_mutex);
            m_sink = std::move(sink);
        }

        auto enabled(Level level) const -> bool
        {
            std::lock_guard lock(m_mutex);
            return level >= m_config.minLevel;
        }

        template<typename... Args>
        auto log(Level level,
                 std::source_location loc,
                 const FunctionInfo& function,
                 std::format_string<Args...> fmt,
                 Args&&... args) -> void
        {
            LoggerConfig config;
            Sink sink;
            {
                std::lock_guard lock(m_mutex);
                if (level < m_config.minLevel) {
                    return;
                }
                config = m_config;
                sink = m_sink;
            }

            // Formatting and the sink run unlocked; both may log again.
            try {
                LogEntry entry{ std::chrono::system_clock::now(),
                                level,
                                std::format(fmt, std::forward<Args>(args)...),
                                std::this_thread::get_id(),
                                loc.file_name(),
                                loc.line(),
                                function };
                if (sink) {
                    sink(entry);
                }
                else {
                    print(entry, config);
                }
            } catch (const std::exception& ex) {
                std::println(stderr, "[Logger Error] {}:{}: {}", loc.file_name(), loc.line(), ex.what());
            } catch (...) {
                std::println(stderr, "[Logger Error] {}:{}: unknown exception", loc.file_name(), loc.line());
            }
        }

        static auto render(const LogEntry& entry, const LoggerConfig& config) -> std::string
        {
            std::string line;
            auto out{ std::back_inserter(line) };

            if (config.showTimestamp) {
                try {
                    auto ts = std::chrono::floor<std::chrono::milliseconds>(entry.timestamp);
                    std::format_to(out, "[{}] ", std::vformat(config.timestampFormat, std::make_format_args(ts)));
                } catch (const std::format_error&) {
                    std::format_to(out, "[Timestamp Error] ");
                }
            }

            if (config.showLevel) {
                std::format_to(out, "[{}] ", entry.level);
            }

            if (config.showThreadId) {
                std::stringstream ss;
                ss << entry.threadId;
                std::format_to(out, "[Thread {}] ", ss.str());
            }

            if (config.showFile || config.showLine || config.showFunction) {
                line += '[';
                bool first = true;
                if (config.showFile) {
                    line += entry.file;
                    first = false;
                }
                if (config.showLine) {
                    if (!first)
                        line += ':';
                    std::format_to(out, "{}", entry.line);
                    first = false;
                }
                if (config.showFunction) {
                    if (!first)
                        line += ' ';
                    std::format_to(out, "in {}", entry.function.full_name);
                }
                line += "] ";
            }

            line += entry.message;
            return line;
        }

      private:
        static auto print(const LogEntry& entry, const LoggerConfig& config) -> void
        {
            if (entry.level == Level::Error) {
                std::println(stderr, "{}", render(entry, config));
            }
            else {
                std::println("{}", render(entry, config));
            }
        }

        mutable std::mutex m_mutex;
        LoggerConfig m_config{};
        Sink m_sink{};
    };

    inline auto parseLevel(std::string_view name) -> Result<Level>
    {
        std::string lowered(name);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

        if (lowered == "debug") {
            return Level::Debug;
        }
        if (lowered == "info") {
            return Level::Info;
        }
        if (lowered == "warning" || lowered == "warn") {
            return Level::Warning;
        }
        if (lowered == "error") {
            return Level::Error;
        }
        return faultless::error(std::format("unknown log level: {}", name));
    }

    inline auto LoggerConfig::fromEnvironment() -> Result<LoggerConfig>
    {
        LoggerConfig config{};

        const auto* level{ std::getenv("FAULTLESS_LOG_LEVEL") };
        if (level == nullptr) {
            return config;
        }

        auto parsed{ parseLevel(level) };
        if (!parsed) {
            return faultless::error(parsed.error());
        }
        config.minLevel = *parsed;
        return config;
    }

    template<typename... Args>
    auto debug(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Debug, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto info(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Info, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto warning(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Warning, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    auto error(FormatString<std::type_identity_t<Args>...> fmt, Args&&... args) -> void
    {
        Logger::instance().log(Level::Error, fmt.loc, fmt.function, fmt.str, std::forward<Args>(args)...);
    }
}
