#include "ProcessDetector.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <cctype>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <tlhelp32.h>
#else
#include <filesystem>
#include <fstream>
#include <system_error>
#endif

namespace
{

std::atomic<bool> g_scan_warning_reported{ false };

std::string ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void ReportScanFailureOnce(const std::string& details)
{
    if (g_scan_warning_reported.exchange(true))
        return;

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Process scan failed", details);
}

} // namespace

bool ProcessDetector::isProcessRunning(const std::string& processName)
{
    if (processName.empty())
        return false;
    return scan(processName);
}

#ifdef _WIN32
bool ProcessDetector::scan(const std::string& processName)
{
    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snapshot == INVALID_HANDLE_VALUE)
    {
        ReportScanFailureOnce("CreateToolhelp32Snapshot error " + std::to_string(GetLastError()));
        return false;
    }

    PROCESSENTRY32 entry;
    entry.dwSize = sizeof(entry);

    if (!Process32First(snapshot, &entry))
    {
        DWORD err = GetLastError();
        CloseHandle(snapshot);
        ReportScanFailureOnce("Process32First error " + std::to_string(err));
        return false;
    }

    const std::string target = ToLower(processName);

    bool found = false;
    do
    {
        if (ToLower(entry.szExeFile) == target)
        {
            found = true;
            break;
        }
    } while (Process32Next(snapshot, &entry));

    CloseHandle(snapshot);
    return found;
}
#else
bool ProcessDetector::scan(const std::string& processName)
{
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    if (ec)
    {
        ReportScanFailureOnce("/proc unavailable: " + ec.message());
        return false;
    }

    // comm is truncated to 15 characters by the kernel
    const std::string target = ToLower(processName).substr(0, 15);

    for (const auto& entry : it)
    {
        const std::string dirname = entry.path().filename().string();
        if (dirname.empty() || !std::all_of(dirname.begin(), dirname.end(), ::isdigit))
            continue;

        std::ifstream comm_file(entry.path() / "comm");
        std::string current_name;
        if (comm_file && std::getline(comm_file, current_name) && ToLower(current_name) == target)
            return true;
    }
    return false;
}
#endif
