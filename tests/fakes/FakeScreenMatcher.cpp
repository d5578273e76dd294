#include "FakeScreenMatcher.hpp"

#include <stdexcept>

namespace test_utils {

void FakeScreenMatcher::show(const std::string& name, admute::ScreenPoint at)
{
    std::lock_guard<std::mutex> lock(mutex_);
    visible_[name] = at;
}

void FakeScreenMatcher::hide(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    visible_.erase(name);
}

void FakeScreenMatcher::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    visible_.clear();
}

void FakeScreenMatcher::throwOn(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    throwing_.insert(name);
}

std::optional<admute::ScreenPoint> FakeScreenMatcher::Locate(const admute::TemplateImage& image, double confidence)
{
    std::lock_guard<std::mutex> lock(mutex_);
    queries_.push_back(image.name);
    last_confidence_ = confidence;

    if (throwing_.count(image.name))
        throw std::runtime_error("capture failed");

    auto it = visible_.find(image.name);
    if (it == visible_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> FakeScreenMatcher::queries() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queries_;
}

double FakeScreenMatcher::lastConfidence() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_confidence_;
}

admute::TemplateImage makeTemplate(const std::string& name)
{
    admute::TemplateImage image;
    image.name = name;
    image.path = name;
    image.pixels = cv::Mat(4, 4, CV_8UC1, cv::Scalar(128));
    return image;
}

} // namespace test_utils
