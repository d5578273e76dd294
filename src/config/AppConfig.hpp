#pragma once

#include "admute/control/ControllerSettings.hpp"
#include "admute/mute/MuteMethod.hpp"

#include <filesystem>
#include <string>

struct DetectionConfig
{
    std::filesystem::path ads_dir = "ads";
    std::filesystem::path muted_icon = "volume/mute.png";
    std::filesystem::path unmuted_icon = "volume/volume.png";
};

struct MuteConfig
{
    admute::MuteMethod method = admute::MuteMethod::Session;
    std::string process_name = "spotify.exe";
};

// Built once at startup by ConfigLoader and passed by const reference
// afterwards; nothing reads config.toml at runtime.
struct AppConfig
{
    DetectionConfig detection;
    admute::ControllerSettings controller;
    MuteConfig mute;
    bool use_menu = true;
};
