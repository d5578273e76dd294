#pragma once

#include "AppConfig.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

class ConfigLoader
{
public:
    explicit ConfigLoader(std::filesystem::path config_path = "config.toml");

    // Never throws. A missing file yields defaults; a parse error yields
    // defaults and a Configuration warning.
    AppConfig load();

    // Parses TOML text directly; relative paths resolve against base_dir.
    AppConfig loadFromString(std::string_view text, const std::filesystem::path& base_dir);

    const std::filesystem::path& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    AppConfig fromTable(const toml::table& root, const std::filesystem::path& base_dir);

    void readDetection(const toml::table& root, const std::filesystem::path& base_dir, AppConfig& cfg);
    void readPolling(const toml::table& root, AppConfig& cfg);
    void readMute(const toml::table& root, AppConfig& cfg);
    void readApp(const toml::table& root, AppConfig& cfg);

    std::filesystem::path resolvePath(const std::filesystem::path& base_dir, const std::string& value) const;
    void warn(std::string message);

    std::filesystem::path config_path_;
    std::string last_error_;
    std::vector<std::string> warnings_;
};
