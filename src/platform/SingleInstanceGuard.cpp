#include "SingleInstanceGuard.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace
{

void ReportAlreadyRunning()
{
    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "admute is already running",
                                      "Another instance holds the single-instance lock.");
}

#ifndef _WIN32
std::filesystem::path LockFilePath(const std::string& name)
{
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec)
        dir = "/tmp";
    return dir / (name + "-" + std::to_string(getuid()) + ".lock");
}
#endif

} // namespace

#ifdef _WIN32
SingleInstanceGuard::SingleInstanceGuard(void* handle, std::string name)
    : mutex_handle_(handle)
    , name_(std::move(name))
{
}

SingleInstanceGuard::~SingleInstanceGuard()
{
    if (mutex_handle_)
    {
        ReleaseMutex(static_cast<HANDLE>(mutex_handle_));
        CloseHandle(static_cast<HANDLE>(mutex_handle_));
    }
}

std::unique_ptr<SingleInstanceGuard> SingleInstanceGuard::Acquire(const std::string& name)
{
    // Per-session namespace: the player's mute state is per user
    const std::string mutex_name = "Local\\AdMuteInstance-" + name;

    HANDLE mutex = CreateMutexA(nullptr, TRUE, mutex_name.c_str());
    if (!mutex)
    {
        DWORD err = GetLastError();
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "CreateMutexA failed with error " + std::to_string(err));
        return nullptr;
    }

    if (GetLastError() == ERROR_ALREADY_EXISTS)
    {
        CloseHandle(mutex);
        ReportAlreadyRunning();
        return nullptr;
    }

    PLOG_DEBUG << "Single-instance mutex acquired: " << mutex_name;
    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard(mutex, name));
}
#else
SingleInstanceGuard::SingleInstanceGuard(int fd, std::string name)
    : lock_fd_(fd)
    , name_(std::move(name))
{
}

SingleInstanceGuard::~SingleInstanceGuard()
{
    if (lock_fd_ >= 0)
    {
        flock(lock_fd_, LOCK_UN);
        close(lock_fd_);
    }
}

std::unique_ptr<SingleInstanceGuard> SingleInstanceGuard::Acquire(const std::string& name)
{
    const auto path = LockFilePath(name);

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "open(" + path.string() + "): " + std::strerror(errno));
        return nullptr;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        const int err = errno;
        close(fd);
        if (err == EWOULDBLOCK)
        {
            ReportAlreadyRunning();
        }
        else
        {
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                              "flock(" + path.string() + "): " + std::strerror(err));
        }
        return nullptr;
    }

    PLOG_DEBUG << "Single-instance lock acquired: " << path.string();
    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard(fd, name));
}
#endif
