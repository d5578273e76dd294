#include "../AudioSessionController.hpp"
#include "ComThreadScope.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <mmdeviceapi.h>
#include <audiopolicy.h> // IAudioSessionManager2, IAudioSessionControl2, ISimpleAudioVolume

#include <plog/Log.h>

#include <cstdio>
#include <string>
#include <vector>

namespace admute
{

namespace
{

// COM must be entered on every thread that touches the session objects;
// the controller loop runs on its own thread. The scope is released when
// that thread exits, after the loop's fail-safe unmute.
bool EnsureComOnThisThread()
{
    thread_local ComThreadScope scope;
    if (scope.entered())
        return true;

    const HRESULT hr = scope.enter();
    if (scope.entered())
        return true;
    PLOG_WARNING << "CoInitializeEx failed on worker thread: 0x" << std::hex << hr;
    return false;
}

// QueryFullProcessImageNameA, no psapi
bool PidToExeLower(DWORD pid, std::string& exe_lower)
{
    if (pid == 0)
        return false; // "System Sounds"
    HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!h)
        return false;

    char buf[1024];
    DWORD size = static_cast<DWORD>(sizeof(buf));
    bool ok = false;
    if (QueryFullProcessImageNameA(h, 0, buf, &size))
    {
        exe_lower = AudioSessionController::BasenameLower(std::string(buf, size));
        ok = true;
    }
    CloseHandle(h);
    return ok;
}

std::string HResultText(const char* what, HRESULT hr)
{
    char code[16];
    std::snprintf(code, sizeof(code), "0x%08lX", static_cast<unsigned long>(hr));
    return std::string(what) + " failed: " + code;
}

} // namespace

AudioSessionController::~AudioSessionController() { Shutdown(); }

bool AudioSessionController::Init()
{
    last_error_.clear();

    HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
    if (SUCCEEDED(hr))
        com_initialized_ = true;
    else if (hr != RPC_E_CHANGED_MODE)
    {
        last_error_ = HResultText("CoInitializeEx", hr);
        return false;
    }

    IMMDeviceEnumerator* enumerator = nullptr;
    hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL, __uuidof(IMMDeviceEnumerator),
                          reinterpret_cast<void**>(&enumerator));
    if (FAILED(hr))
    {
        last_error_ = HResultText("CoCreateInstance(MMDeviceEnumerator)", hr);
        Shutdown();
        return false;
    }

    IMMDevice* device = nullptr;
    hr = enumerator->GetDefaultAudioEndpoint(eRender, eMultimedia, &device);
    if (FAILED(hr))
    {
        enumerator->Release();
        last_error_ = HResultText("GetDefaultAudioEndpoint", hr);
        Shutdown();
        return false;
    }

    IAudioSessionManager2* manager = nullptr;
    hr = device->Activate(__uuidof(IAudioSessionManager2), CLSCTX_ALL, nullptr, reinterpret_cast<void**>(&manager));
    if (FAILED(hr))
    {
        device->Release();
        enumerator->Release();
        last_error_ = HResultText("IMMDevice::Activate(IAudioSessionManager2)", hr);
        Shutdown();
        return false;
    }

    enumerator_ = enumerator;
    device_ = device;
    session_manager_ = manager;
    PLOG_DEBUG << "Audio session manager ready";
    return true;
}

void AudioSessionController::Shutdown()
{
    if (session_manager_)
    {
        static_cast<IAudioSessionManager2*>(session_manager_)->Release();
        session_manager_ = nullptr;
    }
    if (device_)
    {
        static_cast<IMMDevice*>(device_)->Release();
        device_ = nullptr;
    }
    if (enumerator_)
    {
        static_cast<IMMDeviceEnumerator*>(enumerator_)->Release();
        enumerator_ = nullptr;
    }
    if (com_initialized_)
    {
        CoUninitialize();
        com_initialized_ = false;
    }
}

bool AudioSessionController::withSessions(const std::function<void(void*, const std::string&)>& fn)
{
    if (!session_manager_ || !EnsureComOnThisThread())
        return false;

    IAudioSessionEnumerator* sessions = nullptr;
    HRESULT hr = static_cast<IAudioSessionManager2*>(session_manager_)->GetSessionEnumerator(&sessions);
    if (FAILED(hr) || !sessions)
        return false;

    int count = 0;
    sessions->GetCount(&count);

    for (int i = 0; i < count; ++i)
    {
        IAudioSessionControl* ctrl = nullptr;
        if (FAILED(sessions->GetSession(i, &ctrl)) || !ctrl)
            continue;

        IAudioSessionControl2* ctrl2 = nullptr;
        if (FAILED(ctrl->QueryInterface(__uuidof(IAudioSessionControl2), reinterpret_cast<void**>(&ctrl2))) || !ctrl2)
        {
            ctrl->Release();
            continue;
        }

        ISimpleAudioVolume* volume = nullptr;
        if (FAILED(ctrl->QueryInterface(__uuidof(ISimpleAudioVolume), reinterpret_cast<void**>(&volume))) || !volume)
        {
            ctrl2->Release();
            ctrl->Release();
            continue;
        }

        DWORD pid = 0;
        std::string exe_lower;
        if (SUCCEEDED(ctrl2->GetProcessId(&pid)) && PidToExeLower(pid, exe_lower))
        {
            fn(volume, exe_lower);
        }

        volume->Release();
        ctrl2->Release();
        ctrl->Release();
    }

    sessions->Release();
    return true;
}

bool AudioSessionController::SetAppMute(const std::string& process_name, bool mute)
{
    const std::string wanted = BasenameLower(process_name);
    bool applied = false;

    withSessions([&](void* volume, const std::string& exe_lower) {
        if (exe_lower != wanted)
            return;
        if (SUCCEEDED(static_cast<ISimpleAudioVolume*>(volume)->SetMute(mute ? TRUE : FALSE, nullptr)))
            applied = true;
    });
    return applied;
}

std::vector<std::string> AudioSessionController::ListSessionProcesses()
{
    std::vector<std::string> names;
    withSessions([&](void*, const std::string& exe_lower) { names.push_back(exe_lower); });
    return names;
}

} // namespace admute
