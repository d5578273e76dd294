#pragma once

#include <functional>
#include <string>
#include <vector>

namespace admute
{

// Per-application mute through audio sessions on the default render
// endpoint (WASAPI). Sessions are matched by executable basename,
// case-insensitively ("Spotify.exe" == "spotify.exe"). A process can own
// several sessions; mute is applied to all of them.
class AudioSessionController
{
public:
    AudioSessionController() = default;
    ~AudioSessionController();

    AudioSessionController(const AudioSessionController&) = delete;
    AudioSessionController& operator=(const AudioSessionController&) = delete;

    bool Init(); // COM + endpoint + IAudioSessionManager2
    void Shutdown();
    bool IsReady() const { return session_manager_ != nullptr; }

    // Reason the last Init() failed
    const std::string& LastError() const { return last_error_; }

    // False when no session of the process exists
    bool SetAppMute(const std::string& process_name, bool mute);

    // Lowercased executable names of all current sessions (system sounds excluded)
    std::vector<std::string> ListSessionProcesses();

    bool HasSession(const std::string& process_name);

    // "C:\\path\\Spotify.exe" -> "spotify.exe"
    static std::string BasenameLower(const std::string& full_path);

private:
    // fn receives ISimpleAudioVolume* and the lowercased executable name
    bool withSessions(const std::function<void(void* volume, const std::string& exe_lower)>& fn);

    void* enumerator_ = nullptr;      // IMMDeviceEnumerator*
    void* device_ = nullptr;          // IMMDevice*
    void* session_manager_ = nullptr; // IAudioSessionManager2*
    bool com_initialized_ = false;
    std::string last_error_;
};

} // namespace admute
