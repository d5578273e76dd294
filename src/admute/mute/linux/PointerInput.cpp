#include "../PointerInput.hpp"

namespace admute
{

bool PointerInput::IsSupported() { return false; }

bool PointerInput::Click(ScreenPoint) { return false; }

} // namespace admute
