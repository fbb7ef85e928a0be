#include "faultless/faultless.hpp"

#include <format>
#include <print>
#include <stdexcept>
#include <string>

namespace
{
    auto step(std::string name, bool fail) -> faultless::Result<std::string>
    {
        faultless::log::info("running step {}", name);
        if (fail) {
            return faultless::error(std::format("step {} failed", name));
        }
        return faultless::ok(std::move(name));
    }
}

int main()
{
    auto config{ faultless::log::LoggerConfig::fromEnvironment() };
    if (!config) {
        std::println(stderr, "{}", config.error());
        return 1;
    }
    config->showTimestamp = false;
    config->showFunction = true;
    faultless::log::Logger::instance().setConfig(*config);

    // Stops at "b": "c" is never produced and the final value is never computed.
    auto stopped{ faultless::runSequence([]() -> faultless::Sequence<std::string> {
        co_yield step("a", false);
        co_yield step("b", true);
        co_yield step("c", false);
        co_return "done";
    }) };
    std::println("stopped: {}", stopped);

    auto finished{ faultless::runSequence([]() -> faultless::Sequence<int> {
        auto first = co_yield step("1", false);
        auto second = co_yield step("2", false);
        faultless::log::info("checkpoints {} and {} passed", first, second);
        co_return 42;
    }) };
    std::println("finished: {}", finished);

    auto checked{ faultless::runSequence([]() -> faultless::Sequence<> { co_yield step("only", false); }) };
    std::println("no return value: {}", checked);

    auto contained{ faultless::runSequence([]() -> faultless::Sequence<int> {
        co_yield step("before fault", false);
        throw std::runtime_error("disk on fire");
        co_return 0;
    }) };
    std::println("contained: {:v}", contained.error());

    return 0;
}
