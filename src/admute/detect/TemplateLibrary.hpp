#pragma once

#include "../screen/ScreenTypes.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace admute
{

// Both icons are optional; a missing one degrades mute-state observation
// to Unknown instead of failing.
struct MuteIconPair
{
    std::optional<TemplateImage> muted;
    std::optional<TemplateImage> unmuted;

    bool complete() const { return muted.has_value() && unmuted.has_value(); }
};

class TemplateLibrary
{
public:
    // All .png/.jpg/.jpeg files in dir, sorted by file name (priority order).
    // std::nullopt when dir does not exist; an empty vector is allowed.
    static std::optional<std::vector<TemplateImage>> LoadAdTemplates(const std::filesystem::path& dir);

    static std::optional<TemplateImage> LoadIcon(const std::filesystem::path& path);

    static MuteIconPair LoadIconPair(const std::filesystem::path& muted_path,
                                     const std::filesystem::path& unmuted_path);

    static bool IsImageFile(const std::filesystem::path& path);

    static std::optional<TemplateImage> LoadImage(const std::filesystem::path& path);
};

} // namespace admute
