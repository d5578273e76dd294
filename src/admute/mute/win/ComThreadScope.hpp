#pragma once

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <objbase.h>

namespace admute
{

// Enters the multithreaded COM apartment on the calling thread and leaves it
// on destruction. Only a successful CoInitializeEx is balanced; a thread
// already in another apartment (RPC_E_CHANGED_MODE) is used as is.
class ComThreadScope
{
public:
    ComThreadScope() = default;
    ~ComThreadScope()
    {
        if (owns_)
            CoUninitialize();
    }

    ComThreadScope(const ComThreadScope&) = delete;
    ComThreadScope& operator=(const ComThreadScope&) = delete;

    HRESULT enter()
    {
        if (entered_)
            return S_FALSE;

        HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
        if (SUCCEEDED(hr))
            owns_ = true;
        if (SUCCEEDED(hr) || hr == RPC_E_CHANGED_MODE)
            entered_ = true;
        return hr;
    }

    bool entered() const { return entered_; }

private:
    bool entered_ = false;
    bool owns_ = false;
};

} // namespace admute
