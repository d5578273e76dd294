#pragma once

#include "IScreenMatcher.hpp"
#include "ScreenCapture.hpp"

#include <functional>
#include <optional>

namespace admute
{

struct MatchScore
{
    double score = 0.0;
    cv::Point top_left;
};

// IScreenMatcher backed by OpenCV normalized cross-correlation. Each call
// grabs a fresh frame, so results always describe the current screen.
class TemplateMatcher : public IScreenMatcher
{
public:
    using FrameSource = std::function<ScreenFrame()>;

    TemplateMatcher();
    explicit TemplateMatcher(FrameSource source);

    std::optional<ScreenPoint> Locate(const TemplateImage& image, double confidence) override;

    // Best TM_CCOEFF_NORMED score of templ inside a grayscale frame, or
    // std::nullopt when the template does not fit or the score is not finite.
    static std::optional<MatchScore> BestMatch(const cv::Mat& gray_frame, const cv::Mat& templ);

    static cv::Mat ToGray(const cv::Mat& pixels);

private:
    FrameSource source_;
};

} // namespace admute
