#include "SignalBridge.hpp"

#include <atomic>
#include <csignal>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <chrono>
#include <thread>
#else
#include <signal.h>
#endif

namespace platform {

namespace
{

std::atomic<bool> g_interrupt{ false };
std::atomic<bool> g_shutdown_complete{ false };

static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");

#ifdef _WIN32
BOOL WINAPI ConsoleCtrlHandler(DWORD ctrl_type)
{
    switch (ctrl_type)
    {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
        g_interrupt.store(true);
        return TRUE;
    case CTRL_CLOSE_EVENT:
    case CTRL_LOGOFF_EVENT:
    case CTRL_SHUTDOWN_EVENT:
    {
        g_interrupt.store(true);
        const auto deadline = std::chrono::steady_clock::now() + SignalBridge::kCloseGrace;
        while (!g_shutdown_complete.load() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return TRUE;
    }
    default:
        return FALSE;
    }
}
#else
extern "C" void HandleTerminationSignal(int)
{
    g_interrupt.store(true);
}
#endif

} // namespace

void SignalBridge::Install()
{
#ifdef _WIN32
    SetConsoleCtrlHandler(ConsoleCtrlHandler, TRUE);
#else
    // No SA_RESTART: a blocking menu read returns with EINTR
    struct sigaction action = {};
    action.sa_handler = HandleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

bool SignalBridge::InterruptRequested() { return g_interrupt.load(); }

void SignalBridge::Reset()
{
    g_interrupt.store(false);
    g_shutdown_complete.store(false);
}

void SignalBridge::MarkShutdownComplete() { g_shutdown_complete.store(true); }

} // namespace platform
