#pragma once

#include "admute/screen/IScreenMatcher.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace test_utils {

// Screen contents keyed by template name. Thread-safe so the controller
// thread can poll while a test changes what is "on screen".
class FakeScreenMatcher : public admute::IScreenMatcher {
public:
    void show(const std::string& name, admute::ScreenPoint at = { 100, 200 });
    void hide(const std::string& name);
    void clear();

    // Locate() throws std::runtime_error for this template
    void throwOn(const std::string& name);

    std::optional<admute::ScreenPoint> Locate(const admute::TemplateImage& image, double confidence) override;

    std::vector<std::string> queries() const;
    double lastConfidence() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, admute::ScreenPoint> visible_;
    std::set<std::string> throwing_;
    std::vector<std::string> queries_;
    double last_confidence_ = 0.0;
};

// Named template with a small non-empty pixel block
admute::TemplateImage makeTemplate(const std::string& name);

} // namespace test_utils
