#include <catch2/catch_test_macros.hpp>

#include "admute/detect/TemplateLibrary.hpp"
#include "fakes/TempDir.hpp"
#include "utils/ErrorReporter.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using admute::TemplateLibrary;

namespace
{

void writeImage(const std::filesystem::path& path, int width = 8, int height = 6)
{
    cv::Mat image(height, width, CV_8UC3);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));
    REQUIRE(cv::imwrite(path.string(), image));
}

bool hasFatal()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity == utils::ErrorSeverity::Fatal)
            return true;
    }
    return false;
}

} // namespace

TEST_CASE("TemplateLibrary - Ad template directory", "[templates]")
{
    utils::ErrorReporter::ClearErrors();
    test_utils::TempDir dir;

    SECTION("Missing directory is a startup failure")
    {
        auto result = TemplateLibrary::LoadAdTemplates(dir / "does-not-exist");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(hasFatal());
    }

    SECTION("Empty directory loads nothing but is not fatal")
    {
        auto result = TemplateLibrary::LoadAdTemplates(dir.path());
        REQUIRE(result.has_value());
        REQUIRE(result->empty());
        REQUIRE_FALSE(hasFatal());
    }

    SECTION("Images are sorted by file name")
    {
        writeImage(dir / "c_sponsor.png");
        writeImage(dir / "a_banner.jpg");
        writeImage(dir / "b_video.jpeg");

        auto result = TemplateLibrary::LoadAdTemplates(dir.path());
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 3);
        REQUIRE((*result)[0].name == "a_banner.jpg");
        REQUIRE((*result)[1].name == "b_video.jpeg");
        REQUIRE((*result)[2].name == "c_sponsor.png");
    }

    SECTION("Pixels are loaded as grayscale")
    {
        writeImage(dir / "ad.png", 12, 7);

        auto result = TemplateLibrary::LoadAdTemplates(dir.path());
        REQUIRE(result->size() == 1);
        const auto& image = result->front();
        REQUIRE(image.pixels.channels() == 1);
        REQUIRE(image.pixels.cols == 12);
        REQUIRE(image.pixels.rows == 7);
        REQUIRE(image.path == dir / "ad.png");
    }

    SECTION("Non-image files and unreadable images are skipped")
    {
        writeImage(dir / "good.png");
        dir.writeText("notes.txt", "not an image");
        dir.writeText("broken.png", "definitely not png data");
        std::filesystem::create_directories(dir / "nested.png");

        auto result = TemplateLibrary::LoadAdTemplates(dir.path());
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 1);
        REQUIRE(result->front().name == "good.png");
    }
}

TEST_CASE("TemplateLibrary - Image extensions", "[templates]")
{
    REQUIRE(TemplateLibrary::IsImageFile("ad.png"));
    REQUIRE(TemplateLibrary::IsImageFile("AD.PNG"));
    REQUIRE(TemplateLibrary::IsImageFile("ad.Jpg"));
    REQUIRE(TemplateLibrary::IsImageFile("ad.jpeg"));
    REQUIRE_FALSE(TemplateLibrary::IsImageFile("ad.gif"));
    REQUIRE_FALSE(TemplateLibrary::IsImageFile("png"));
    REQUIRE_FALSE(TemplateLibrary::IsImageFile("ad.png.txt"));
}

TEST_CASE("TemplateLibrary - Mute icons", "[templates]")
{
    utils::ErrorReporter::ClearErrors();
    test_utils::TempDir dir;

    SECTION("Both icons present")
    {
        writeImage(dir / "mute.png");
        writeImage(dir / "volume.png");

        auto icons = TemplateLibrary::LoadIconPair(dir / "mute.png", dir / "volume.png");
        REQUIRE(icons.complete());
        REQUIRE(icons.muted->name == "mute.png");
        REQUIRE(icons.unmuted->name == "volume.png");
    }

    SECTION("A missing icon degrades without a fatal report")
    {
        writeImage(dir / "volume.png");

        auto icons = TemplateLibrary::LoadIconPair(dir / "mute.png", dir / "volume.png");
        REQUIRE_FALSE(icons.complete());
        REQUIRE_FALSE(icons.muted.has_value());
        REQUIRE(icons.unmuted.has_value());
        REQUIRE_FALSE(hasFatal());
    }

    SECTION("Unreadable icon is absent")
    {
        dir.writeText("mute.png", "garbage");
        REQUIRE_FALSE(TemplateLibrary::LoadIcon(dir / "mute.png").has_value());
    }
}
