#include <catch2/catch_test_macros.hpp>

#include "admute/detect/AdDetector.hpp"
#include "fakes/FakeScreenMatcher.hpp"

using admute::MuteIconState;
using test_utils::makeTemplate;

namespace
{

std::vector<admute::TemplateImage> adSet()
{
    return { makeTemplate("01-banner.png"), makeTemplate("02-video.png"), makeTemplate("03-sponsor.png") };
}

admute::MuteIconPair bothIcons()
{
    admute::MuteIconPair icons;
    icons.muted = makeTemplate("mute.png");
    icons.unmuted = makeTemplate("volume.png");
    return icons;
}

} // namespace

TEST_CASE("AdDetector - Ad detection", "[detector]")
{
    test_utils::FakeScreenMatcher screen;
    admute::AdDetector detector(screen, adSet(), {}, 0.85);

    SECTION("Nothing on screen")
    {
        REQUIRE_FALSE(detector.DetectAd().has_value());
        REQUIRE(screen.queries().size() == 3);
    }

    SECTION("First template in priority order wins")
    {
        screen.show("02-video.png", { 10, 20 });
        screen.show("03-sponsor.png", { 30, 40 });

        auto match = detector.DetectAd();
        REQUIRE(match.has_value());
        REQUIRE(match->index == 1);
        REQUIRE(match->name == "02-video.png");
        REQUIRE(match->position == admute::ScreenPoint{ 10, 20 });
    }

    SECTION("Stops scanning after the first match")
    {
        screen.show("01-banner.png");
        REQUIRE(detector.DetectAd().has_value());
        REQUIRE(screen.queries() == std::vector<std::string>{ "01-banner.png" });
    }

    SECTION("Threshold is passed through to the matcher")
    {
        detector.DetectAd();
        REQUIRE(screen.lastConfidence() == 0.85);
    }

    SECTION("A throwing template is skipped, later ones still match")
    {
        screen.throwOn("01-banner.png");
        screen.show("03-sponsor.png");

        auto match = detector.DetectAd();
        REQUIRE(match.has_value());
        REQUIRE(match->name == "03-sponsor.png");
    }
}

TEST_CASE("AdDetector - Empty template set never matches", "[detector]")
{
    test_utils::FakeScreenMatcher screen;
    admute::AdDetector detector(screen, {}, {}, 0.9);

    REQUIRE_FALSE(detector.DetectAd().has_value());
    REQUIRE(detector.ScanAll().empty());
}

TEST_CASE("AdDetector - Mute icon state", "[detector]")
{
    test_utils::FakeScreenMatcher screen;

    SECTION("Muted icon visible")
    {
        admute::AdDetector detector(screen, {}, bothIcons(), 0.9);
        screen.show("mute.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Muted);
    }

    SECTION("Unmuted icon visible")
    {
        admute::AdDetector detector(screen, {}, bothIcons(), 0.9);
        screen.show("volume.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Unmuted);
    }

    SECTION("Muted icon is checked first")
    {
        admute::AdDetector detector(screen, {}, bothIcons(), 0.9);
        screen.show("mute.png");
        screen.show("volume.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Muted);
    }

    SECTION("Neither visible")
    {
        admute::AdDetector detector(screen, {}, bothIcons(), 0.9);
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Unknown);
    }

    SECTION("Missing icon templates give Unknown without querying")
    {
        admute::AdDetector detector(screen, {}, {}, 0.9);
        screen.show("mute.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Unknown);
        REQUIRE(screen.queries().empty());
    }

    SECTION("Only the unmuted template loaded reads as Unknown")
    {
        admute::MuteIconPair icons;
        icons.unmuted = makeTemplate("volume.png");
        admute::AdDetector detector(screen, {}, icons, 0.9);

        screen.show("volume.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Unknown);
        REQUIRE(screen.queries().empty());
    }

    SECTION("Only the muted template loaded reads as Unknown")
    {
        admute::MuteIconPair icons;
        icons.muted = makeTemplate("mute.png");
        admute::AdDetector detector(screen, {}, icons, 0.9);

        screen.show("mute.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Unknown);
    }

    SECTION("A half-loaded pair still locates the loaded icon")
    {
        admute::MuteIconPair icons;
        icons.muted = makeTemplate("mute.png");
        admute::AdDetector detector(screen, {}, icons, 0.9);

        screen.show("mute.png", { 7, 8 });
        REQUIRE(detector.LocateIcon(MuteIconState::Muted) == admute::ScreenPoint{ 7, 8 });
    }

    SECTION("Matcher failure reads as Unknown")
    {
        admute::AdDetector detector(screen, {}, bothIcons(), 0.9);
        screen.throwOn("mute.png");
        screen.throwOn("volume.png");
        REQUIRE(detector.ObserveMuteIconState() == MuteIconState::Unknown);
    }
}

TEST_CASE("AdDetector - Icon location", "[detector]")
{
    test_utils::FakeScreenMatcher screen;
    admute::AdDetector detector(screen, {}, bothIcons(), 0.9);
    screen.show("volume.png", { 640, 1010 });

    REQUIRE(detector.LocateIcon(MuteIconState::Unmuted) == admute::ScreenPoint{ 640, 1010 });
    REQUIRE_FALSE(detector.LocateIcon(MuteIconState::Muted).has_value());
    REQUIRE_FALSE(detector.LocateIcon(MuteIconState::Unknown).has_value());
}

TEST_CASE("AdDetector - Full scan reports every template", "[detector]")
{
    test_utils::FakeScreenMatcher screen;
    admute::AdDetector detector(screen, adSet(), {}, 0.9);
    screen.show("01-banner.png", { 1, 2 });
    screen.show("03-sponsor.png", { 5, 6 });

    auto results = detector.ScanAll();

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].position == admute::ScreenPoint{ 1, 2 });
    REQUIRE_FALSE(results[1].position.has_value());
    REQUIRE(results[2].name == "03-sponsor.png");
    REQUIRE(results[2].position == admute::ScreenPoint{ 5, 6 });
}
