#include "AudioSessionController.hpp"

#include <algorithm>
#include <cctype>

namespace admute
{

std::string AudioSessionController::BasenameLower(const std::string& full_path)
{
    std::string s = full_path;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    size_t sep = s.find_last_of("\\/");
    if (sep != std::string::npos)
        s = s.substr(sep + 1);
    return s;
}

bool AudioSessionController::HasSession(const std::string& process_name)
{
    const std::string wanted = BasenameLower(process_name);
    auto names = ListSessionProcesses();
    return std::find(names.begin(), names.end(), wanted) != names.end();
}

} // namespace admute
