#include "../ScreenCapture.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <stdexcept>
#include <string>

namespace admute
{

namespace
{

struct GdiResources
{
    HDC screen = nullptr;
    HDC memdc = nullptr;
    HBITMAP bitmap = nullptr;
    HGDIOBJ previous = nullptr;

    ~GdiResources()
    {
        if (previous && memdc)
            SelectObject(memdc, previous);
        if (bitmap)
            DeleteObject(bitmap);
        if (memdc)
            DeleteDC(memdc);
        if (screen)
            ReleaseDC(nullptr, screen);
    }
};

} // namespace

bool ScreenCapture::IsSupported() { return true; }

ScreenFrame ScreenCapture::Grab()
{
    const int x = GetSystemMetrics(SM_XVIRTUALSCREEN);
    const int y = GetSystemMetrics(SM_YVIRTUALSCREEN);
    const int w = GetSystemMetrics(SM_CXVIRTUALSCREEN);
    const int h = GetSystemMetrics(SM_CYVIRTUALSCREEN);
    if (w <= 0 || h <= 0)
        throw std::runtime_error("virtual screen has no area");

    GdiResources gdi;
    gdi.screen = GetDC(nullptr);
    if (!gdi.screen)
        throw std::runtime_error("GetDC failed: " + std::to_string(GetLastError()));

    gdi.memdc = CreateCompatibleDC(gdi.screen);
    gdi.bitmap = CreateCompatibleBitmap(gdi.screen, w, h);
    if (!gdi.memdc || !gdi.bitmap)
        throw std::runtime_error("CreateCompatibleBitmap failed: " + std::to_string(GetLastError()));

    gdi.previous = SelectObject(gdi.memdc, gdi.bitmap);
    if (!BitBlt(gdi.memdc, 0, 0, w, h, gdi.screen, x, y, SRCCOPY | CAPTUREBLT))
        throw std::runtime_error("BitBlt failed: " + std::to_string(GetLastError()));

    BITMAPINFOHEADER header{};
    header.biSize = sizeof(header);
    header.biWidth = w;
    header.biHeight = -h; // top-down rows
    header.biPlanes = 1;
    header.biBitCount = 32;
    header.biCompression = BI_RGB;

    ScreenFrame frame;
    frame.pixels.create(h, w, CV_8UC4);
    frame.origin = ScreenPoint{ x, y };

    // GetDIBits wants the bitmap deselected
    SelectObject(gdi.memdc, gdi.previous);
    gdi.previous = nullptr;

    int rows = GetDIBits(gdi.memdc, gdi.bitmap, 0, static_cast<UINT>(h), frame.pixels.data,
                         reinterpret_cast<BITMAPINFO*>(&header), DIB_RGB_COLORS);
    if (rows != h)
        throw std::runtime_error("GetDIBits copied " + std::to_string(rows) + " of " + std::to_string(h) + " rows");

    return frame;
}

} // namespace admute
