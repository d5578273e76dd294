#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

#include <cstdint>
#include <fstream>
#include <system_error>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogManager::Settings LogManager::ReadSettings(const std::filesystem::path& config_path, bool force_verbose)
{
    Settings settings;
    if (force_verbose)
        settings.level = plog::debug;

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return settings;

    toml::table root;
    try
    {
        root = toml::parse_file(config_path.string());
    }
    catch (const toml::parse_error&)
    {
        // Reported by ConfigLoader once a logger exists
        return settings;
    }

    if (auto append = root["global"]["append_logs"].value<bool>())
        settings.append = *append;

    if (root["app"]["debug"]["verbose"].value_or(false))
        settings.level = plog::debug;

    if (auto level = root["app"]["debug"]["logging_level"].value<std::int64_t>())
    {
        if (*level >= plog::none && *level <= plog::verbose)
            settings.level = static_cast<plog::Severity>(*level);
    }

    return settings;
}

void LogManager::Initialize(const std::filesystem::path& config_path, bool force_verbose)
{
    if (s_initialized)
        return;

    s_settings = ReadSettings(config_path, force_verbose);
    s_initialized = true;
}

bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.filepath);
        return false;
    }

    const std::filesystem::path file(config.filepath);
    std::error_code ec;
    if (file.has_parent_path())
        std::filesystem::create_directories(file.parent_path(), ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to create log directory", ec.message());
    }

    try
    {
        if (!s_settings.append)
            std::ofstream(file, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);
        auto& logger = plog::init(s_settings.level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file " + config.filepath,
                                   ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    s_appenders.clear();
    s_initialized = false;
}

} // namespace utils
