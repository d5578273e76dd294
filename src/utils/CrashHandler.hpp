#pragma once

namespace utils
{

// Last-chance handling for std::terminate and, on Windows, structured
// exceptions. The registered cleanup runs first so a crash mid-ad still
// restores the player's audio; then a cpptrace stack trace is logged and
// (Windows) a minidump is written to logs/.
class CrashHandler
{
public:
    static void Initialize();

    /// Thread-local label printed in the crash log ("startup", "running", ...)
    static void SetContext(const char* operation);

    /// Called at most once per process on a crash path; nullptr unregisters
    static void RegisterFatalCleanup(void (*fn)());
};

} // namespace utils
