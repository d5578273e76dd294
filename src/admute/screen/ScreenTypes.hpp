#pragma once

#include <filesystem>
#include <string>

#include <opencv2/core.hpp>

namespace admute
{

struct ScreenPoint
{
    int x = 0;
    int y = 0;

    bool operator==(const ScreenPoint&) const = default;
};

// Reference image searched for on screen. Pixels are single-channel
// grayscale so matching ignores theme tint.
struct TemplateImage
{
    std::string name; // file name, used in logs and diagnostics
    std::filesystem::path path;
    cv::Mat pixels;

    bool empty() const { return pixels.empty(); }
};

} // namespace admute
