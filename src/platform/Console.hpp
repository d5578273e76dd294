#pragma once

namespace platform {

class Console
{
public:
    // UTF-8 output for template file names; no-op outside Windows
    static void EnableUtf8();

    // False when stdin is a pipe, a file or absent (service, scheduled task)
    static bool StdinIsInteractive();
};

} // namespace platform
