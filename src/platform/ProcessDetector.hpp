#pragma once

#include <string>

class ProcessDetector
{
public:
    // Case-insensitive executable-name match ("spotify.exe", "admute")
    static bool isProcessRunning(const std::string& processName);

private:
    static bool scan(const std::string& processName);
};
