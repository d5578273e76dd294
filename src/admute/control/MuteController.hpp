#pragma once

#include "ControllerSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

namespace admute
{

class AdDetector;
class IMuteActuator;
enum class MuteIconState;

enum class ControllerState
{
    Paused,  // detection inactive
    Idle,    // enabled, no ad on screen
    AdActive // enabled, ad on screen or an unmute still pending
};

const char* ControllerStateToString(ControllerState state);

struct CycleOutcome
{
    ControllerState state = ControllerState::Paused;
    std::chrono::milliseconds next_delay{ 0 };
};

// Polls the detector and mutes the player for the duration of an ad.
//
// The loop thread is the only writer of the believed mute state and the
// only caller of the actuator. The shell only flips `enabled` and asks the
// loop to stop. Whenever the controller pauses or stops while it believes
// the player is muted, it unmutes first (fail-safe unmute).
class MuteController
{
public:
    MuteController(const ControllerSettings& settings, AdDetector& detector, IMuteActuator& actuator);
    ~MuteController();

    MuteController(const MuteController&) = delete;
    MuteController& operator=(const MuteController&) = delete;

    // Spawns the loop thread; starts Paused until SetEnabled(true)
    void Start();

    // Stops the loop and joins it. Returns after the fail-safe unmute ran.
    void Stop();

    bool IsRunning() const { return worker_.joinable(); }

    void SetEnabled(bool enabled);
    bool IsEnabled() const { return enabled_.load(std::memory_order_acquire); }

    // One detection cycle. Driven by the loop thread; tests call it directly.
    CycleOutcome RunCycle();

    ControllerState State() const { return state_.load(std::memory_order_acquire); }
    bool IsBelievedMuted() const { return believed_muted_.load(std::memory_order_acquire); }

    // Crash path only: unmutes from whichever thread is dying
    void EmergencyUnmute();

private:
    void loop(std::stop_token stop);
    void enterPaused(const char* reason);
    void reconcile(MuteIconState observed);
    std::chrono::milliseconds delayFor(ControllerState state) const;

    const ControllerSettings& settings_;
    AdDetector& detector_;
    IMuteActuator& actuator_;

    std::atomic<bool> enabled_{ false };
    std::atomic<bool> believed_muted_{ false };
    std::atomic<ControllerState> state_{ ControllerState::Paused };

    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    bool wake_pending_ = false;

    std::jthread worker_;
};

} // namespace admute
