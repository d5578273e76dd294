#include "AdDetector.hpp"

#include <plog/Log.h>

#include <exception>

namespace admute
{

const char* MuteIconStateToString(MuteIconState state)
{
    switch (state)
    {
    case MuteIconState::Muted:
        return "muted";
    case MuteIconState::Unmuted:
        return "unmuted";
    case MuteIconState::Unknown:
        return "unknown";
    }
    return "unknown";
}

AdDetector::AdDetector(IScreenMatcher& matcher, std::vector<TemplateImage> ad_templates, MuteIconPair icons,
                       double confidence)
    : matcher_(matcher)
    , ad_templates_(std::move(ad_templates))
    , icons_(std::move(icons))
    , confidence_(confidence)
{
}

std::optional<AdMatch> AdDetector::DetectAd()
{
    for (std::size_t i = 0; i < ad_templates_.size(); ++i)
    {
        const auto& ad = ad_templates_[i];
        PLOG_DEBUG << "Checking ad image: '" << ad.name << "'";
        if (auto pos = locate(ad))
        {
            PLOG_INFO << "Ad detected via image '" << ad.name << "' at (" << pos->x << ", " << pos->y << ")";
            return AdMatch{ i, ad.name, *pos };
        }
    }
    return std::nullopt;
}

MuteIconState AdDetector::ObserveMuteIconState()
{
    // One icon alone cannot tell "other state" from "icon not on screen"
    if (!icons_.complete())
        return MuteIconState::Unknown;

    if (LocateIcon(MuteIconState::Muted))
        return MuteIconState::Muted;
    if (LocateIcon(MuteIconState::Unmuted))
        return MuteIconState::Unmuted;
    return MuteIconState::Unknown;
}

std::optional<ScreenPoint> AdDetector::LocateIcon(MuteIconState state)
{
    const std::optional<TemplateImage>* icon = nullptr;
    switch (state)
    {
    case MuteIconState::Muted:
        icon = &icons_.muted;
        break;
    case MuteIconState::Unmuted:
        icon = &icons_.unmuted;
        break;
    case MuteIconState::Unknown:
        return std::nullopt;
    }

    if (!icon->has_value())
        return std::nullopt;
    return locate(**icon);
}

std::vector<TemplateScanResult> AdDetector::ScanAll()
{
    std::vector<TemplateScanResult> results;
    results.reserve(ad_templates_.size());
    for (const auto& ad : ad_templates_)
    {
        results.push_back({ ad.name, ad.path, locate(ad) });
    }
    return results;
}

std::optional<ScreenPoint> AdDetector::locate(const TemplateImage& image)
{
    try
    {
        return matcher_.Locate(image, confidence_);
    }
    catch (const std::exception& ex)
    {
        PLOG_DEBUG << "locate failed for '" << image.name << "': " << ex.what();
        return std::nullopt;
    }
}

} // namespace admute
