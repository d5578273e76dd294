#pragma once

#include "IMuteActuator.hpp"
#include "../detect/AdDetector.hpp"

#include <functional>

namespace admute
{

// Toggles mute by clicking the player's own volume icon. To mute it looks
// for the icon that currently shows "unmuted" and clicks it; to unmute it
// looks for the "muted" icon.
class ClickMuteActuator : public IMuteActuator
{
public:
    using ClickFn = std::function<bool(ScreenPoint)>;

    explicit ClickMuteActuator(AdDetector& detector, ClickFn click = &PointerInputClick);

    bool ApplyMute(bool muted) override;
    std::string_view Name() const override { return "click"; }

private:
    static bool PointerInputClick(ScreenPoint point);

    AdDetector& detector_;
    ClickFn click_;
};

} // namespace admute
