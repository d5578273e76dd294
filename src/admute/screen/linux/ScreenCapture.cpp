#include "../ScreenCapture.hpp"

#include <stdexcept>

namespace admute
{

// The player this tool watches only ships a desktop build with WASAPI
// sessions on Windows; there is no grab backend here.
bool ScreenCapture::IsSupported() { return false; }

ScreenFrame ScreenCapture::Grab()
{
    throw std::runtime_error("screen capture is not supported on this platform");
}

} // namespace admute
