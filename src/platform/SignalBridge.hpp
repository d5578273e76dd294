#pragma once

#include <chrono>

namespace platform {

/// Turns Ctrl+C, SIGTERM and console close events into a flag the shell
/// polls, so shutdown (and the fail-safe unmute) runs on normal threads.
class SignalBridge
{
public:
    static void Install();

    static bool InterruptRequested();

    /// Test hook and re-arm after a handled interrupt
    static void Reset();

    /// Windows kills the process once a close/logoff handler returns; the
    /// handler waits (bounded by `grace`) until the shell calls this.
    static void MarkShutdownComplete();

    static constexpr std::chrono::milliseconds kCloseGrace{ 4000 };
};

} // namespace platform
