#include "SessionMuteActuator.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace admute
{

SessionMuteActuator::SessionMuteActuator(AudioSessionController& sessions, std::string process_name)
    : sessions_(sessions)
    , process_name_(std::move(process_name))
{
}

bool SessionMuteActuator::ApplyMute(bool muted)
{
    if (sessions_.SetAppMute(process_name_, muted))
    {
        PLOG_INFO << process_name_ << (muted ? " muted" : " unmuted") << " (session)";
        return true;
    }

    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::AudioSession,
                                        std::string("Could not ") + (muted ? "mute" : "unmute") + " player",
                                        "No audio session owned by '" + process_name_ + "'");
    return false;
}

} // namespace admute
