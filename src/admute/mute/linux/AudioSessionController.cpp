#include "../AudioSessionController.hpp"

namespace admute
{

AudioSessionController::~AudioSessionController() { Shutdown(); }

bool AudioSessionController::Init()
{
    last_error_ = "per-application audio sessions are only available through WASAPI on Windows";
    return false;
}

void AudioSessionController::Shutdown() {}

bool AudioSessionController::withSessions(const std::function<void(void*, const std::string&)>&)
{
    return false;
}

bool AudioSessionController::SetAppMute(const std::string&, bool) { return false; }

std::vector<std::string> AudioSessionController::ListSessionProcesses() { return {}; }

} // namespace admute
