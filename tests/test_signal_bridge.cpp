#include <catch2/catch_test_macros.hpp>

#include "platform/SignalBridge.hpp"

#include <csignal>

TEST_CASE("SignalBridge - Interrupt flag", "[platform]")
{
    platform::SignalBridge::Reset();
    REQUIRE_FALSE(platform::SignalBridge::InterruptRequested());

#ifndef _WIN32
    platform::SignalBridge::Install();
    std::raise(SIGTERM);
    REQUIRE(platform::SignalBridge::InterruptRequested());
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#endif

    platform::SignalBridge::Reset();
    REQUIRE_FALSE(platform::SignalBridge::InterruptRequested());
}
