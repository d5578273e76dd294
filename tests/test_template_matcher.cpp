#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "admute/screen/TemplateMatcher.hpp"

#include <opencv2/core.hpp>

#include <stdexcept>

using Catch::Matchers::WithinAbs;
using admute::ScreenFrame;
using admute::ScreenPoint;
using admute::TemplateImage;
using admute::TemplateMatcher;

namespace
{

cv::Mat noiseFrame(int width, int height, int seed)
{
    cv::Mat frame(height, width, CV_8UC4);
    cv::RNG rng(seed);
    rng.fill(frame, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
    return frame;
}

TemplateImage cropTemplate(const cv::Mat& frame, cv::Rect roi, const std::string& name = "ad.png")
{
    TemplateImage image;
    image.name = name;
    image.pixels = TemplateMatcher::ToGray(frame)(roi).clone();
    return image;
}

TemplateMatcher fixedSource(const cv::Mat& pixels, ScreenPoint origin = {})
{
    return TemplateMatcher([pixels, origin] { return ScreenFrame{ pixels, origin }; });
}

} // namespace

TEST_CASE("TemplateMatcher - Locating a template on a synthetic frame", "[matcher]")
{
    const cv::Mat frame = noiseFrame(200, 150, 7);
    const TemplateImage templ = cropTemplate(frame, cv::Rect(50, 40, 20, 16));

    SECTION("Returns the center of the match")
    {
        auto matcher = fixedSource(frame);
        auto pos = matcher.Locate(templ, 0.9);
        REQUIRE(pos.has_value());
        REQUIRE(*pos == ScreenPoint{ 60, 48 });
    }

    SECTION("Position is offset by the frame origin")
    {
        auto matcher = fixedSource(frame, { -1920, 100 });
        auto pos = matcher.Locate(templ, 0.9);
        REQUIRE(pos.has_value());
        REQUIRE(*pos == ScreenPoint{ -1860, 148 });
    }

    SECTION("Unrelated template stays below the threshold")
    {
        const cv::Mat other = noiseFrame(200, 150, 99);
        const TemplateImage stranger = cropTemplate(other, cv::Rect(10, 10, 20, 16));

        auto matcher = fixedSource(frame);
        REQUIRE_FALSE(matcher.Locate(stranger, 0.9).has_value());
    }

    SECTION("Each call grabs a fresh frame")
    {
        int grabs = 0;
        TemplateMatcher matcher(
            [&]
            {
                ++grabs;
                return ScreenFrame{ frame, {} };
            });
        matcher.Locate(templ, 0.9);
        matcher.Locate(templ, 0.9);
        REQUIRE(grabs == 2);
    }
}

TEST_CASE("TemplateMatcher - Misses without errors", "[matcher]")
{
    const cv::Mat frame = noiseFrame(40, 30, 3);

    SECTION("Template larger than the frame")
    {
        const cv::Mat big = noiseFrame(80, 60, 4);
        auto matcher = fixedSource(frame);
        REQUIRE_FALSE(matcher.Locate(cropTemplate(big, cv::Rect(0, 0, 60, 50)), 0.5).has_value());
    }

    SECTION("Empty frame")
    {
        auto matcher = fixedSource(cv::Mat{});
        REQUIRE_FALSE(matcher.Locate(cropTemplate(frame, cv::Rect(0, 0, 8, 8)), 0.5).has_value());
    }

    SECTION("Empty template")
    {
        auto matcher = fixedSource(frame);
        REQUIRE_FALSE(matcher.Locate(TemplateImage{}, 0.5).has_value());
    }
}

TEST_CASE("TemplateMatcher - Capture failure propagates", "[matcher]")
{
    TemplateMatcher matcher([]() -> ScreenFrame { throw std::runtime_error("BitBlt failed"); });
    TemplateImage templ;
    templ.pixels = cv::Mat(4, 4, CV_8UC1, cv::Scalar(10));

    REQUIRE_THROWS_AS(matcher.Locate(templ, 0.9), std::runtime_error);
}

TEST_CASE("TemplateMatcher - Best match score", "[matcher]")
{
    const cv::Mat gray = TemplateMatcher::ToGray(noiseFrame(64, 48, 11));
    REQUIRE(gray.channels() == 1);

    auto best = TemplateMatcher::BestMatch(gray, gray(cv::Rect(30, 20, 12, 10)).clone());
    REQUIRE(best.has_value());
    REQUIRE_THAT(best->score, WithinAbs(1.0, 1e-4));
    REQUIRE(best->top_left == cv::Point(30, 20));

    REQUIRE_FALSE(TemplateMatcher::BestMatch(gray, cv::Mat{}).has_value());
}
