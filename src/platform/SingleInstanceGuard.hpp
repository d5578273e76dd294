#pragma once

#include <memory>
#include <string>

// Held for the whole process lifetime. A second admute would read the same
// icons and toggle the same session, undoing the first one's mute.
class SingleInstanceGuard
{
public:
    // nullptr when another instance holds the lock (reported as Fatal)
    static std::unique_ptr<SingleInstanceGuard> Acquire(const std::string& name = "admute");
    ~SingleInstanceGuard();

    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;

    const std::string& name() const { return name_; }

private:
#ifdef _WIN32
    SingleInstanceGuard(void* handle, std::string name);
    void* mutex_handle_ = nullptr;
#else
    SingleInstanceGuard(int fd, std::string name);
    int lock_fd_ = -1;
#endif
    std::string name_;
};
