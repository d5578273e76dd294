#include "FakeMuteActuator.hpp"

#include <algorithm>

namespace test_utils {

bool FakeMuteActuator::ApplyMute(bool muted)
{
    std::function<void(bool, bool)> hook;
    bool ok = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(muted);
        if (!script_.empty())
        {
            ok = script_.front();
            script_.pop_front();
        }
        else
        {
            ok = default_result_;
        }
        hook = hook_;
    }

    if (hook)
        hook(muted, ok);
    return ok;
}

void FakeMuteActuator::setDefaultResult(bool ok)
{
    std::lock_guard<std::mutex> lock(mutex_);
    default_result_ = ok;
}

void FakeMuteActuator::scriptResults(std::initializer_list<bool> results)
{
    std::lock_guard<std::mutex> lock(mutex_);
    script_.insert(script_.end(), results.begin(), results.end());
}

void FakeMuteActuator::onApply(std::function<void(bool, bool)> hook)
{
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

std::vector<bool> FakeMuteActuator::calls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

int FakeMuteActuator::muteCalls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count(calls_.begin(), calls_.end(), true));
}

int FakeMuteActuator::unmuteCalls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count(calls_.begin(), calls_.end(), false));
}

} // namespace test_utils
