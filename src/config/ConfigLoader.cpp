#include "ConfigLoader.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace
{

constexpr std::int64_t kMinIntervalMs = 10;
constexpr std::int64_t kMaxIntervalMs = 60 * 1000;

} // namespace

ConfigLoader::ConfigLoader(fs::path config_path)
    : config_path_(std::move(config_path))
{
}

AppConfig ConfigLoader::load()
{
    last_error_.clear();
    warnings_.clear();

    const fs::path base_dir = config_path_.parent_path();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_.string() << ", using defaults";
        return fromTable(toml::table{}, base_dir);
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), base_dir);
}

AppConfig ConfigLoader::loadFromString(std::string_view text, const fs::path& base_dir)
{
    last_error_.clear();
    warnings_.clear();

    try
    {
        toml::table root = toml::parse(text, config_path_.string());
        return fromTable(root, base_dir);
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_.string());
        return fromTable(toml::table{}, base_dir);
    }
}

AppConfig ConfigLoader::fromTable(const toml::table& root, const fs::path& base_dir)
{
    AppConfig cfg;
    readDetection(root, base_dir, cfg);
    readPolling(root, cfg);
    readMute(root, cfg);
    readApp(root, cfg);
    return cfg;
}

void ConfigLoader::readDetection(const toml::table& root, const fs::path& base_dir, AppConfig& cfg)
{
    auto detection = root["detection"];

    if (auto dir = detection["ads_dir"].value<std::string>())
        cfg.detection.ads_dir = *dir;
    if (auto muted = detection["muted_icon"].value<std::string>())
        cfg.detection.muted_icon = *muted;
    if (auto unmuted = detection["unmuted_icon"].value<std::string>())
        cfg.detection.unmuted_icon = *unmuted;

    cfg.detection.ads_dir = resolvePath(base_dir, cfg.detection.ads_dir.string());
    cfg.detection.muted_icon = resolvePath(base_dir, cfg.detection.muted_icon.string());
    cfg.detection.unmuted_icon = resolvePath(base_dir, cfg.detection.unmuted_icon.string());

    if (auto confidence = detection["confidence"].value<double>())
    {
        if (*confidence <= 0.0)
        {
            warn("detection.confidence must be greater than 0, keeping " + std::to_string(cfg.controller.confidence));
        }
        else if (*confidence > 1.0)
        {
            warn("detection.confidence clamped to 1.0");
            cfg.controller.confidence = 1.0;
        }
        else
        {
            cfg.controller.confidence = *confidence;
        }
    }
}

void ConfigLoader::readPolling(const toml::table& root, AppConfig& cfg)
{
    auto polling = root["polling"];

    auto read_interval = [&](const char* key, std::chrono::milliseconds& out)
    {
        auto value = polling[key].value<std::int64_t>();
        if (!value)
            return;

        std::int64_t clamped = std::clamp(*value, kMinIntervalMs, kMaxIntervalMs);
        if (clamped != *value)
        {
            warn(std::string("polling.") + key + " clamped to " + std::to_string(clamped) + " ms");
        }
        out = std::chrono::milliseconds(clamped);
    };

    read_interval("ad_active_ms", cfg.controller.ad_active_interval);
    read_interval("idle_ms", cfg.controller.idle_interval);
    read_interval("paused_ms", cfg.controller.paused_interval);
}

void ConfigLoader::readMute(const toml::table& root, AppConfig& cfg)
{
    auto mute = root["mute"];

    if (auto method = mute["method"].value<std::string>())
    {
        if (auto parsed = admute::ParseMuteMethod(*method))
        {
            cfg.mute.method = *parsed;
        }
        else
        {
            warn("mute.method '" + *method + "' is not one of session/click, keeping " +
                 admute::MuteMethodToString(cfg.mute.method));
        }
    }

    if (auto process = mute["process_name"].value<std::string>())
    {
        if (process->empty())
            warn("mute.process_name is empty, keeping " + cfg.mute.process_name);
        else
            cfg.mute.process_name = *process;
    }
}

void ConfigLoader::readApp(const toml::table& root, AppConfig& cfg)
{
    if (auto use_menu = root["app"]["use_menu"].value<bool>())
        cfg.use_menu = *use_menu;
    // [app.debug] belongs to LogManager, which reads it before this loader runs
}

fs::path ConfigLoader::resolvePath(const fs::path& base_dir, const std::string& value) const
{
    fs::path p(value);
    if (p.is_absolute() || base_dir.empty())
        return p;
    return base_dir / p;
}

void ConfigLoader::warn(std::string message)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Invalid configuration value", message);
    warnings_.push_back(std::move(message));
}
