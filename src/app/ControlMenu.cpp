#include "ControlMenu.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace
{

std::string Normalize(std::string_view line)
{
    auto first = std::find_if_not(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(line.rbegin(), line.rend(), [](unsigned char c) { return std::isspace(c); }).base();

    std::string out;
    if (first < last)
        out.assign(first, last);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

ControlMenu::ControlMenu(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out)
{
}

void ControlMenu::Render(bool running) const
{
    out_ << "\nadmute: ((" << (running ? "running" : "paused") << "))\n"
         << "  1) " << (running ? "Pause" : "Run") << "\n"
         << "  2) Stop\n"
         << "  3) Diagnose\n"
         << "> " << std::flush;
}

ControlMenu::Choice ControlMenu::Read()
{
    std::string line;
    if (!std::getline(in_, line))
        return Choice::EndOfInput;

    const Choice choice = Parse(line);
    if (choice == Choice::Invalid)
        out_ << "Unknown option '" << line << "'\n";
    return choice;
}

void ControlMenu::WaitForEnter()
{
    out_ << "\nPress Enter to return to menu..." << std::flush;
    std::string ignored;
    std::getline(in_, ignored);
}

ControlMenu::Choice ControlMenu::Parse(std::string_view line)
{
    const std::string key = Normalize(line);

    if (key == "1" || key == "r" || key == "run" || key == "p" || key == "pause")
        return Choice::ToggleRun;
    if (key == "2" || key == "s" || key == "stop" || key == "q" || key == "quit")
        return Choice::Stop;
    if (key == "3" || key == "d" || key == "diagnose")
        return Choice::Diagnose;
    return Choice::Invalid;
}
