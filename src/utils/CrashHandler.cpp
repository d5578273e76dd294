#include "CrashHandler.hpp"
#include <plog/Log.h>
#include <cpptrace/cpptrace.hpp>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <dbghelp.h>
#include <ctime>
#endif

namespace
{

std::atomic<void (*)()> g_fatal_cleanup{ nullptr };
std::atomic<bool> g_cleanup_ran{ false };
std::terminate_handler g_prev_terminate = nullptr;

thread_local const char* g_current_operation = nullptr;

void RunFatalCleanupOnce()
{
    if (g_cleanup_ran.exchange(true))
        return;

    if (auto fn = g_fatal_cleanup.load(std::memory_order_acquire))
    {
        try
        {
            fn();
        }
        catch (const std::exception& ex)
        {
            PLOG_FATAL << "Fatal cleanup threw: " << ex.what();
        }
        catch (...)
        {
            PLOG_FATAL << "Fatal cleanup threw a non-standard exception";
        }
    }
}

void LogStackTrace()
{
    try
    {
        std::ostringstream trace_ss;
        trace_ss << cpptrace::generate_trace(1);
        const std::string trace = trace_ss.str();
        if (trace.empty())
        {
            PLOG_FATAL << "No stack trace available (cpptrace returned empty).";
            return;
        }

        PLOG_FATAL << "Stack trace (most recent call first):";
        std::istringstream lines(trace);
        std::string line;
        while (std::getline(lines, line))
        {
            if (!line.empty())
                PLOG_FATAL << line;
        }
    }
    catch (const std::exception& e)
    {
        PLOG_FATAL << "Failed to generate stack trace: " << e.what();
    }
}

void CrashTerminateHandler()
{
    RunFatalCleanupOnce();

    PLOG_FATAL << "=== std::terminate called ===";
    if (g_current_operation)
    {
        PLOG_FATAL << "Operation: " << g_current_operation;
    }
    if (auto current = std::current_exception())
    {
        try
        {
            std::rethrow_exception(current);
        }
        catch (const std::exception& ex)
        {
            PLOG_FATAL << "Uncaught exception: " << ex.what();
        }
        catch (...)
        {
            PLOG_FATAL << "Uncaught non-standard exception";
        }
    }
    LogStackTrace();

    if (g_prev_terminate)
    {
        g_prev_terminate();
        return;
    }
    std::abort();
}

#ifdef _WIN32
void WriteMiniDump(EXCEPTION_POINTERS* ex)
{
    char filename[64] = {};
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_s(&local, &now);
    std::strftime(filename, sizeof(filename), "logs/admute_crash_%Y%m%d_%H%M%S.dmp", &local);

    HANDLE file = CreateFileA(filename, GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file == INVALID_HANDLE_VALUE)
    {
        PLOG_FATAL << "Could not create crash dump " << filename << ": " << GetLastError();
        return;
    }

    MINIDUMP_EXCEPTION_INFORMATION info{};
    info.ThreadId = GetCurrentThreadId();
    info.ExceptionPointers = ex;
    info.ClientPointers = FALSE;

    const BOOL written =
        MiniDumpWriteDump(GetCurrentProcess(), GetCurrentProcessId(), file, MiniDumpNormal, &info, nullptr, nullptr);
    CloseHandle(file);

    if (written)
        PLOG_FATAL << "Crash dump written: " << filename;
    else
        PLOG_FATAL << "MiniDumpWriteDump failed: " << GetLastError();
}

LONG WINAPI CrashHandlerFunction(EXCEPTION_POINTERS* ex)
{
    RunFatalCleanupOnce();

    PLOG_FATAL << "=== APPLICATION CRASHED ===";
    DWORD code = ex->ExceptionRecord->ExceptionCode;
    PLOG_FATAL << "Exception: 0x" << std::hex << code;
    PLOG_FATAL << "Address: 0x" << std::hex << ex->ExceptionRecord->ExceptionAddress;
    if (g_current_operation)
    {
        PLOG_FATAL << "Operation: " << g_current_operation;
    }

    LogStackTrace();

    WriteMiniDump(ex);

    return EXCEPTION_EXECUTE_HANDLER;
}
#endif

} // namespace

void utils::CrashHandler::Initialize()
{
#ifdef _WIN32
    SetUnhandledExceptionFilter(CrashHandlerFunction);
#endif
    g_prev_terminate = std::set_terminate(CrashTerminateHandler);
    PLOG_INFO << "Crash handler installed";
}

void utils::CrashHandler::SetContext(const char* operation)
{
    g_current_operation = operation;
}

void utils::CrashHandler::RegisterFatalCleanup(void (*fn)())
{
    g_fatal_cleanup.store(fn, std::memory_order_release);
}
