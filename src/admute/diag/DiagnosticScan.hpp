#pragma once

#include "../detect/AdDetector.hpp"
#include "../mute/MuteMethod.hpp"

#include <optional>
#include <string>
#include <vector>

namespace admute
{

class AudioSessionController;

struct AdTemplateStatus
{
    std::string name;
    bool file_exists = false;
    std::optional<ScreenPoint> position;
};

struct DiagnosticReport
{
    MuteMethod method = MuteMethod::Session;
    std::string process_name;

    bool session_api_available = false;
    std::vector<std::string> session_processes;
    bool target_session_found = false;

    bool muted_icon_loaded = false;
    bool unmuted_icon_loaded = false;
    MuteIconState screen_state = MuteIconState::Unknown;

    std::vector<AdTemplateStatus> templates;

    bool anyAdMatched() const;
};

// One-shot, read-only check of everything the controller depends on. Never
// calls the actuator and never touches controller state.
class DiagnosticScan
{
public:
    DiagnosticScan(AdDetector& detector, AudioSessionController* sessions, MuteMethod method,
                   std::string process_name);

    DiagnosticReport Run();

    static void Log(const DiagnosticReport& report);

private:
    AdDetector& detector_;
    AudioSessionController* sessions_;
    MuteMethod method_;
    std::string process_name_;
};

} // namespace admute
