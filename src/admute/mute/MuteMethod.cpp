#include "MuteMethod.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace admute
{

std::optional<MuteMethod> ParseMuteMethod(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "session" || lower == "native")
        return MuteMethod::Session;
    if (lower == "click" || lower == "ui")
        return MuteMethod::Click;
    return std::nullopt;
}

const char* MuteMethodToString(MuteMethod method)
{
    switch (method)
    {
    case MuteMethod::Session:
        return "session";
    case MuteMethod::Click:
        return "click";
    }
    return "unknown";
}

} // namespace admute
