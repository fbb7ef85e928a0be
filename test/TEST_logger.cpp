#include "faultless/evaluate.hpp"
#include "faultless/log/Logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace faultless::log::test
{
    class LoggerTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            m_previous = Logger::instance().config();
            Logger::instance().setSink([this](const LogEntry& entry) { entries.push_back(entry); });
        }

        void TearDown() override
        {
            Logger::instance().setSink({});
            Logger::instance().setConfig(m_previous);
            ::unsetenv("FAULTLESS_LOG_LEVEL");
        }

        std::vector<LogEntry> entries;

      private:
        LoggerConfig m_previous;
    };

    TEST_F(LoggerTest, DropsEntriesBelowMinimumLevel)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Warning });

        debug("hidden {}", 1);
        info("hidden {}", 2);
        warning("shown {}", 3);
        error("shown {}", 4);

        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[0].level, Level::Warning);
        EXPECT_EQ(entries[0].message, "shown 3");
        EXPECT_EQ(entries[1].level, Level::Error);
        EXPECT_EQ(entries[1].message, "shown 4");
        EXPECT_FALSE(Logger::instance().enabled(Level::Info));
        EXPECT_TRUE(Logger::instance().enabled(Level::Error));
    }

    TEST_F(LoggerTest, CapturesSourceLocation)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Debug });

        auto line{ __LINE__ + 1 };
        info("located");

        ASSERT_EQ(entries.size(), 1u);
        EXPECT_EQ(entries[0].line, static_cast<uint32_t>(line));
        EXPECT_NE(entries[0].file.find("TEST_logger.cpp"), std::string::npos);
    }

    TEST_F(LoggerTest, FormatsErrorsAndResults)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Debug });

        Result<int> failed = faultless::error("boom");
        info("{} {:v} {}", ok(1), failed.error(), failed);

        ASSERT_EQ(entries.size(), 1u);
        EXPECT_EQ(entries[0].message, "[ ok: 1 ] MessageError(Message): boom [ error: boom ]");
    }

    TEST_F(LoggerTest, EvaluatorReportsShortCircuitAtDebugLevel)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Debug });

        auto result{ runSequence([]() -> Sequence<int> {
            co_yield ok(1);
            co_yield faultless::error("second");
            co_return 3;
        }) };

        ASSERT_FALSE(result);
        ASSERT_EQ(entries.size(), 1u);
        EXPECT_EQ(entries[0].level, Level::Debug);
        EXPECT_EQ(entries[0].message, "sequence stopped at step 2: second");
    }

    TEST_F(LoggerTest, EvaluatorReportsContainedFaults)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Warning });

        auto result{ runSequence([]() -> int { throw std::runtime_error("bad"); }) };

        ASSERT_FALSE(result);
        ASSERT_EQ(entries.size(), 1u);
        EXPECT_EQ(entries[0].level, Level::Warning);
        EXPECT_EQ(entries[0].message, "fault contained: bad");
    }

    TEST_F(LoggerTest, SinkMayLogAgain)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Debug });
        Logger::instance().setSink([this](const LogEntry& entry) {
            entries.push_back(entry);
            if (entries.size() == 1) {
                info("seen: {}", entry.message);
            }
        });

        auto result{ runSequence([]() -> Sequence<> { co_yield faultless::error("stop"); }) };

        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().message(), "stop");
        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[1].message, "seen: sequence stopped at step 1: stop");
    }

    TEST_F(LoggerTest, ThrowingSinkDoesNotEscape)
    {
        Logger::instance().setConfig(LoggerConfig{ .minLevel = Level::Debug });
        Logger::instance().setSink([](const LogEntry&) { throw 42; });

        auto stopped{ runSequence([]() -> Sequence<int> {
            co_yield faultless::error("stop");
            co_return 1;
        }) };
        ASSERT_FALSE(stopped);
        EXPECT_EQ(stopped.error().code(), Errc::Message);
        EXPECT_EQ(stopped.error().message(), "stop");

        Result<int> faulted{ 0 };
        EXPECT_NO_THROW(faulted = runSequence([]() -> int { throw std::runtime_error("bad"); }));
        ASSERT_FALSE(faulted);
        EXPECT_EQ(faulted.error().code(), Errc::Fault);
        EXPECT_EQ(faulted.error().message(), "bad");
    }

    TEST_F(LoggerTest, RenderHonoursConfig)
    {
        LogEntry entry{ {}, Level::Warning, "message", {}, "file.cpp", 12, { "ns::run", "run", "" } };

        LoggerConfig config{ .showTimestamp = false };
        EXPECT_EQ(Logger::render(entry, config), "[Warning] message");

        config.showLevel = false;
        EXPECT_EQ(Logger::render(entry, config), "message");

        config.showFile = true;
        config.showLine = true;
        config.showFunction = true;
        EXPECT_EQ(Logger::render(entry, config), "[file.cpp:12 in ns::run] message");

        config.showFile = false;
        EXPECT_EQ(Logger::render(entry, config), "[12 in ns::run] message");
    }

    TEST(LogLevelTest, ParseLevel)
    {
        EXPECT_EQ(parseLevel("debug"), ok(Level::Debug));
        EXPECT_EQ(parseLevel("INFO"), ok(Level::Info));
        EXPECT_EQ(parseLevel("Warn"), ok(Level::Warning));
        EXPECT_EQ(parseLevel("warning"), ok(Level::Warning));
        EXPECT_EQ(parseLevel("error"), ok(Level::Error));

        auto unknown{ parseLevel("loud") };
        ASSERT_FALSE(unknown);
        EXPECT_EQ(unknown.error().message(), "unknown log level: loud");
    }

    TEST_F(LoggerTest, ConfigFromEnvironment)
    {
        ::unsetenv("FAULTLESS_LOG_LEVEL");
        auto defaults{ LoggerConfig::fromEnvironment() };
        ASSERT_TRUE(defaults);
        EXPECT_EQ(defaults->minLevel, Level::Info);

        ::setenv("FAULTLESS_LOG_LEVEL", "debug", 1);
        auto verbose{ LoggerConfig::fromEnvironment() };
        ASSERT_TRUE(verbose);
        EXPECT_EQ(verbose->minLevel, Level::Debug);

        ::setenv("FAULTLESS_LOG_LEVEL", "chatty", 1);
        auto invalid{ LoggerConfig::fromEnvironment() };
        ASSERT_FALSE(invalid);
        EXPECT_EQ(invalid.error().message(), "unknown log level: chatty");
    }
}
