#include "ClickMuteActuator.hpp"
#include "PointerInput.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace admute
{

ClickMuteActuator::ClickMuteActuator(AdDetector& detector, ClickFn click)
    : detector_(detector)
    , click_(std::move(click))
{
}

bool ClickMuteActuator::PointerInputClick(ScreenPoint point) { return PointerInput::Click(point); }

bool ClickMuteActuator::ApplyMute(bool muted)
{
    // The icon to click shows the state we are leaving
    const MuteIconState current = muted ? MuteIconState::Unmuted : MuteIconState::Muted;
    const char* action = muted ? "mute" : "unmute";
    const char* label = muted ? "volume" : "mute";

    auto pos = detector_.LocateIcon(current);
    if (!pos)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::AudioSession,
                                            std::string("Could not ") + action + " player",
                                            std::string("'") + label + "' icon not found on screen");
        return false;
    }

    if (!click_(*pos))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::AudioSession,
                                            std::string("Could not ") + action + " player",
                                            "Click injection failed");
        return false;
    }

    PLOG_INFO << "Player " << (muted ? "muted" : "unmuted") << " (clicked " << label << " icon at (" << pos->x
              << ", " << pos->y << "))";
    return true;
}

} // namespace admute
