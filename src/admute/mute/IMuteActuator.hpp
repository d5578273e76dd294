#pragma once

#include <string_view>

namespace admute
{

// Applies a target mute state to the player's audio. Returns false when the
// session or on-screen control could not be found; never throws. Callers
// treat false as "retry later".
class IMuteActuator
{
public:
    virtual ~IMuteActuator() = default;

    virtual bool ApplyMute(bool muted) = 0;
    virtual std::string_view Name() const = 0;
};

} // namespace admute
