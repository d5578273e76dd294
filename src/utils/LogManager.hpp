#pragma once

#include <plog/Severity.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns plog's appenders for the process. Logging comes up before the rest
// of config.toml is parsed so configuration warnings land in the log; only
// the [global] and [app.debug] keys are read here.
class LogManager
{
public:
    struct Settings
    {
        bool append = true;
        plog::Severity level = plog::info;
    };

    struct LoggerConfig
    {
        std::string filepath = "logs/admute.log";
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
        bool add_console_appender = true;
    };

    static void Initialize(const std::filesystem::path& config_path = "config.toml", bool force_verbose = false);

    // Attaches a rolling file appender (and optionally the console) to plog instance 0
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static const Settings& CurrentSettings() { return s_settings; }

    // Precedence: [app.debug] logging_level, then verbose/--verbose, then info
    static Settings ReadSettings(const std::filesystem::path& config_path, bool force_verbose);

private:
    LogManager() = default;

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
