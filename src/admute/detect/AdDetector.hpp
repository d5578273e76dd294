#pragma once

#include "TemplateLibrary.hpp"
#include "../screen/IScreenMatcher.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace admute
{

enum class MuteIconState
{
    Muted,
    Unmuted,
    Unknown
};

const char* MuteIconStateToString(MuteIconState state);

struct AdMatch
{
    std::size_t index = 0; // position in the template list
    std::string name;
    ScreenPoint position;
};

struct TemplateScanResult
{
    std::string name;
    std::filesystem::path path;
    std::optional<ScreenPoint> position;
};

// Answers the two per-cycle questions: is an ad visible, and what does the
// player's own volume icon show. Both are pure reads of the screen. A miss
// (including a matcher exception) is a normal result, never an error.
class AdDetector
{
public:
    AdDetector(IScreenMatcher& matcher, std::vector<TemplateImage> ad_templates, MuteIconPair icons,
               double confidence);

    // First matching template in priority order
    std::optional<AdMatch> DetectAd();

    // Unknown unless both icon templates are loaded. Muted icon is checked
    // first, then unmuted
    MuteIconState ObserveMuteIconState();

    // Position of the icon that shows `state`; Unknown never matches
    std::optional<ScreenPoint> LocateIcon(MuteIconState state);

    // Every ad template, no early exit
    std::vector<TemplateScanResult> ScanAll();

    const std::vector<TemplateImage>& adTemplates() const { return ad_templates_; }
    const MuteIconPair& icons() const { return icons_; }
    double confidence() const { return confidence_; }

private:
    std::optional<ScreenPoint> locate(const TemplateImage& image);

    IScreenMatcher& matcher_;
    std::vector<TemplateImage> ad_templates_;
    MuteIconPair icons_;
    double confidence_;
};

} // namespace admute
