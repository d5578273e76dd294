#include "../PointerInput.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <plog/Log.h>

namespace admute
{

namespace
{

// SendInput absolute coordinates are normalized to 0..65535 over the
// virtual desktop.
LONG Normalize(int value, int origin, int extent)
{
    if (extent <= 1)
        return 0;
    return static_cast<LONG>((static_cast<long long>(value - origin) * 65535) / (extent - 1));
}

} // namespace

bool PointerInput::IsSupported() { return true; }

bool PointerInput::Click(ScreenPoint point)
{
    const int vx = GetSystemMetrics(SM_XVIRTUALSCREEN);
    const int vy = GetSystemMetrics(SM_YVIRTUALSCREEN);
    const int vw = GetSystemMetrics(SM_CXVIRTUALSCREEN);
    const int vh = GetSystemMetrics(SM_CYVIRTUALSCREEN);

    INPUT inputs[3] = {};

    inputs[0].type = INPUT_MOUSE;
    inputs[0].mi.dx = Normalize(point.x, vx, vw);
    inputs[0].mi.dy = Normalize(point.y, vy, vh);
    inputs[0].mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_VIRTUALDESK;

    inputs[1].type = INPUT_MOUSE;
    inputs[1].mi.dwFlags = MOUSEEVENTF_LEFTDOWN;

    inputs[2].type = INPUT_MOUSE;
    inputs[2].mi.dwFlags = MOUSEEVENTF_LEFTUP;

    UINT sent = SendInput(3, inputs, sizeof(INPUT));
    if (sent != 3)
    {
        PLOG_WARNING << "SendInput injected " << sent << " of 3 events: " << GetLastError();
        return false;
    }
    return true;
}

} // namespace admute
