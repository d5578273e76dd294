#pragma once

#include "../screen/ScreenTypes.hpp"

namespace admute
{

class PointerInput
{
public:
    static bool IsSupported();

    // Moves the cursor to `point` (desktop coordinates) and sends one
    // primary-button click. False when the input could not be injected.
    static bool Click(ScreenPoint point);
};

} // namespace admute
