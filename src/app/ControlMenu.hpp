#pragma once

#include <iosfwd>
#include <string_view>

// Text control surface: Run/Pause, Stop, Diagnose.
// Streams are injected so the parser and prompt are testable.
class ControlMenu
{
public:
    enum class Choice
    {
        ToggleRun,
        Stop,
        Diagnose,
        Invalid,
        EndOfInput // stdin closed or a read interrupted by a signal
    };

    ControlMenu(std::istream& in, std::ostream& out);

    void Render(bool running) const;
    Choice Read();

    // Blocks until a line (or end of input) after the diagnostic output
    void WaitForEnter();

    // Accepts the option number or its name, case-insensitive, surrounding
    // whitespace ignored: "1"/"run"/"pause", "2"/"stop"/"quit", "3"/"diagnose"
    static Choice Parse(std::string_view line);

private:
    std::istream& in_;
    std::ostream& out_;
};
