#include "TemplateLibrary.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

namespace admute
{

namespace fs = std::filesystem;

bool TemplateLibrary::IsImageFile(const fs::path& path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}

std::optional<TemplateImage> TemplateLibrary::LoadImage(const fs::path& path)
{
    cv::Mat pixels;
    try
    {
        pixels = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
    }
    catch (const cv::Exception& ex)
    {
        PLOG_WARNING << "Failed to decode '" << path.string() << "': " << ex.what();
        return std::nullopt;
    }

    if (pixels.empty())
        return std::nullopt;

    return TemplateImage{ path.filename().string(), path, std::move(pixels) };
}

std::optional<std::vector<TemplateImage>> TemplateLibrary::LoadAdTemplates(const fs::path& dir)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Ad template directory not found",
                                          "Expected a directory at '" + dir.string() + "'");
        return std::nullopt;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec))
    {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && IsImageFile(entry.path()))
            files.push_back(entry.path());
    }
    if (ec)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Cannot read ad template directory",
                                          dir.string() + ": " + ec.message());
        return std::nullopt;
    }

    std::sort(files.begin(), files.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });

    std::vector<TemplateImage> images;
    images.reserve(files.size());
    for (const auto& file : files)
    {
        if (auto image = LoadImage(file))
        {
            images.push_back(std::move(*image));
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Skipping unreadable ad image",
                                                file.string());
        }
    }

    if (images.empty())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "No ad images found",
                                            "Directory '" + dir.string() + "' has no readable png/jpg files");
    }
    else
    {
        PLOG_INFO << "Loaded " << images.size() << " ad image(s) from '" << dir.string() << "'";
    }

    return images;
}

std::optional<TemplateImage> TemplateLibrary::LoadIcon(const fs::path& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Mute icon image missing",
                                            path.string() + " not found; on-screen mute state will be unknown");
        return std::nullopt;
    }

    auto image = LoadImage(path);
    if (!image)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Mute icon image unreadable",
                                            path.string());
    }
    return image;
}

MuteIconPair TemplateLibrary::LoadIconPair(const fs::path& muted_path, const fs::path& unmuted_path)
{
    MuteIconPair pair;
    pair.muted = LoadIcon(muted_path);
    pair.unmuted = LoadIcon(unmuted_path);
    return pair;
}

} // namespace admute
