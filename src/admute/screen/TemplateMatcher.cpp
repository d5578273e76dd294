#include "TemplateMatcher.hpp"

#include <opencv2/imgproc.hpp>
#include <plog/Log.h>

#include <cmath>

namespace admute
{

TemplateMatcher::TemplateMatcher()
    : source_(&ScreenCapture::Grab)
{
}

TemplateMatcher::TemplateMatcher(FrameSource source)
    : source_(std::move(source))
{
}

std::optional<ScreenPoint> TemplateMatcher::Locate(const TemplateImage& image, double confidence)
{
    if (image.empty())
        return std::nullopt;

    ScreenFrame frame = source_();
    if (frame.pixels.empty())
        return std::nullopt;

    const cv::Mat gray = ToGray(frame.pixels);
    auto best = BestMatch(gray, image.pixels);
    if (!best)
        return std::nullopt;

    PLOG_VERBOSE << "Match score for '" << image.name << "': " << best->score;
    if (best->score < confidence)
        return std::nullopt;

    return ScreenPoint{ frame.origin.x + best->top_left.x + image.pixels.cols / 2,
                        frame.origin.y + best->top_left.y + image.pixels.rows / 2 };
}

std::optional<MatchScore> TemplateMatcher::BestMatch(const cv::Mat& gray_frame, const cv::Mat& templ)
{
    if (gray_frame.empty() || templ.empty())
        return std::nullopt;
    if (templ.cols > gray_frame.cols || templ.rows > gray_frame.rows)
        return std::nullopt;

    cv::Mat result;
    cv::matchTemplate(gray_frame, templ, result, cv::TM_CCOEFF_NORMED);

    double min_val = 0.0;
    double max_val = 0.0;
    cv::Point min_loc;
    cv::Point max_loc;
    cv::minMaxLoc(result, &min_val, &max_val, &min_loc, &max_loc);

    // A flat template has zero variance and scores NaN everywhere
    if (!std::isfinite(max_val))
        return std::nullopt;

    return MatchScore{ max_val, max_loc };
}

cv::Mat TemplateMatcher::ToGray(const cv::Mat& pixels)
{
    cv::Mat gray;
    switch (pixels.channels())
    {
    case 4:
        cv::cvtColor(pixels, gray, cv::COLOR_BGRA2GRAY);
        break;
    case 3:
        cv::cvtColor(pixels, gray, cv::COLOR_BGR2GRAY);
        break;
    default:
        gray = pixels;
        break;
    }
    return gray;
}

} // namespace admute
