#include "MuteController.hpp"
#include "../detect/AdDetector.hpp"
#include "../mute/IMuteActuator.hpp"

#include <plog/Log.h>

#include <exception>

namespace admute
{

const char* ControllerStateToString(ControllerState state)
{
    switch (state)
    {
    case ControllerState::Paused:
        return "paused";
    case ControllerState::Idle:
        return "idle";
    case ControllerState::AdActive:
        return "ad-active";
    }
    return "unknown";
}

MuteController::MuteController(const ControllerSettings& settings, AdDetector& detector, IMuteActuator& actuator)
    : settings_(settings)
    , detector_(detector)
    , actuator_(actuator)
{
}

MuteController::~MuteController() { Stop(); }

void MuteController::Start()
{
    if (worker_.joinable())
        return;

    worker_ = std::jthread([this](std::stop_token stop) { loop(stop); });
    PLOG_DEBUG << "Mute controller thread started";
}

void MuteController::Stop()
{
    enabled_.store(false, std::memory_order_release);

    if (!worker_.joinable())
    {
        // No loop thread to hand the fail-safe to
        enterPaused("stopped");
        return;
    }

    worker_.request_stop();
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_.notify_all();
    worker_.join();
    PLOG_DEBUG << "Mute controller thread joined";
}

void MuteController::SetEnabled(bool enabled)
{
    enabled_.store(enabled, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_.notify_all();
}

void MuteController::loop(std::stop_token stop)
{
    while (!stop.stop_requested())
    {
        CycleOutcome outcome{ State(), settings_.paused_interval };
        try
        {
            outcome = RunCycle();
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Detection cycle failed: " << ex.what();
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, stop, outcome.next_delay, [this] { return wake_pending_; });
        wake_pending_ = false;
    }

    enterPaused("stopped");
}

CycleOutcome MuteController::RunCycle()
{
    if (!enabled_.load(std::memory_order_acquire))
    {
        if (State() != ControllerState::Paused)
            enterPaused("paused");
        return { ControllerState::Paused, delayFor(ControllerState::Paused) };
    }

    if (State() == ControllerState::Paused)
    {
        PLOG_INFO << "Muter started";
        state_.store(ControllerState::Idle, std::memory_order_release);
    }

    PLOG_DEBUG << "Scanning screen for ads... (muted=" << IsBelievedMuted() << ")";

    // The player's own icon is ground truth for the mute state
    reconcile(detector_.ObserveMuteIconState());

    ControllerState next = ControllerState::Idle;
    if (detector_.DetectAd())
    {
        if (!IsBelievedMuted())
        {
            PLOG_INFO << "Ad detected, muting player";
            if (actuator_.ApplyMute(true))
                believed_muted_.store(true, std::memory_order_release);
        }
        next = ControllerState::AdActive;
    }
    else
    {
        PLOG_DEBUG << "No ad on screen.";
        if (IsBelievedMuted())
        {
            PLOG_INFO << "Ad gone, unmuting player";
            if (actuator_.ApplyMute(false))
                believed_muted_.store(false, std::memory_order_release);
        }
        // A failed unmute keeps the fast cadence so audio comes back promptly
        next = IsBelievedMuted() ? ControllerState::AdActive : ControllerState::Idle;
    }

    state_.store(next, std::memory_order_release);
    return { next, delayFor(next) };
}

void MuteController::reconcile(MuteIconState observed)
{
    if (observed == MuteIconState::Unknown)
        return;

    const bool observed_muted = (observed == MuteIconState::Muted);
    if (observed_muted != IsBelievedMuted())
    {
        PLOG_DEBUG << "Mute state corrected from screen: " << IsBelievedMuted() << " -> " << observed_muted;
        believed_muted_.store(observed_muted, std::memory_order_release);
    }
}

void MuteController::enterPaused(const char* reason)
{
    const bool was_paused = (State() == ControllerState::Paused);
    state_.store(ControllerState::Paused, std::memory_order_release);

    if (believed_muted_.load(std::memory_order_acquire))
    {
        PLOG_INFO << "Restoring audio before the muter is " << reason;
        if (!actuator_.ApplyMute(false))
            PLOG_WARNING << "Unmute on " << reason << " failed; player may still be muted";
    }
    believed_muted_.store(false, std::memory_order_release);

    if (!was_paused)
        PLOG_INFO << "Muter " << reason;
}

void MuteController::EmergencyUnmute()
{
    if (believed_muted_.exchange(false, std::memory_order_acq_rel))
        (void)actuator_.ApplyMute(false);
}

std::chrono::milliseconds MuteController::delayFor(ControllerState state) const
{
    switch (state)
    {
    case ControllerState::AdActive:
        return settings_.ad_active_interval;
    case ControllerState::Idle:
        return settings_.idle_interval;
    case ControllerState::Paused:
        return settings_.paused_interval;
    }
    return settings_.paused_interval;
}

} // namespace admute
