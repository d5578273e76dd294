#pragma once

#include "ScreenTypes.hpp"

#include <optional>

namespace admute
{

// Finds a template on the current screen. Returns the CENTER of the best
// match when its similarity is at least `confidence`, std::nullopt otherwise.
// May throw when the desktop cannot be read; callers on the detection path
// treat that as a miss.
class IScreenMatcher
{
public:
    virtual ~IScreenMatcher() = default;

    virtual std::optional<ScreenPoint> Locate(const TemplateImage& image, double confidence) = 0;
};

} // namespace admute
