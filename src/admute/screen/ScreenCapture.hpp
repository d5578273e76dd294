#pragma once

#include "ScreenTypes.hpp"

#include <opencv2/core.hpp>

namespace admute
{

struct ScreenFrame
{
    cv::Mat pixels;       // BGRA (Windows) or BGR; empty when nothing was grabbed
    ScreenPoint origin;   // desktop coordinate of pixels(0, 0)
};

class ScreenCapture
{
public:
    // False when this platform has no desktop grab backend
    static bool IsSupported();

    // Grabs the whole virtual desktop. Throws std::runtime_error on failure.
    static ScreenFrame Grab();
};

} // namespace admute
