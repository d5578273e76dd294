#pragma once

#include <chrono>

namespace admute
{

struct ControllerSettings
{
    // Fast re-check while an ad is on screen so its end is caught promptly
    std::chrono::milliseconds ad_active_interval{ 500 };
    // Slow re-check during normal playback
    std::chrono::milliseconds idle_interval{ 5000 };
    // Paused: no detection, only stays responsive to resume/stop
    std::chrono::milliseconds paused_interval{ 200 };
    // Similarity threshold applied to every template
    double confidence = 0.9;
};

} // namespace admute
