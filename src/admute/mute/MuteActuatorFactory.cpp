#include "MuteActuatorFactory.hpp"
#include "ClickMuteActuator.hpp"
#include "PointerInput.hpp"
#include "SessionMuteActuator.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace admute
{

std::unique_ptr<IMuteActuator> MuteActuatorFactory::Create(MuteMethod method, AdDetector& detector,
                                                           AudioSessionController* sessions,
                                                           const std::string& process_name)
{
    switch (method)
    {
    case MuteMethod::Session:
        if (!sessions || !sessions->IsReady())
        {
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::AudioSession,
                                              "Audio session API unavailable",
                                              sessions ? sessions->LastError() : "no session controller");
            return nullptr;
        }
        PLOG_INFO << "Mute method: audio session of '" << process_name << "'";
        return std::make_unique<SessionMuteActuator>(*sessions, process_name);

    case MuteMethod::Click:
        if (!detector.icons().complete())
        {
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration,
                                              "Click method needs both volume icons",
                                              "Load both the muted and unmuted icon images");
            return nullptr;
        }
        if (!PointerInput::IsSupported())
        {
            utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Click input unavailable",
                                              "Mouse input injection is not supported on this platform");
            return nullptr;
        }
        PLOG_INFO << "Mute method: UI click (on-screen volume icon)";
        return std::make_unique<ClickMuteActuator>(detector);
    }

    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Unknown mute method");
    return nullptr;
}

} // namespace admute
