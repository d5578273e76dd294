#pragma once

#include <optional>
#include <string_view>

namespace admute
{

enum class MuteMethod
{
    Session = 0, // native audio-session mute by process name
    Click = 1    // click the player's own volume icon
};

std::optional<MuteMethod> ParseMuteMethod(std::string_view text);
const char* MuteMethodToString(MuteMethod method);

} // namespace admute
