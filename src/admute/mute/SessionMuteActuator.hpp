#pragma once

#include "IMuteActuator.hpp"
#include "AudioSessionController.hpp"

#include <string>

namespace admute
{

class SessionMuteActuator : public IMuteActuator
{
public:
    // `sessions` must already be initialized and outlive the actuator
    SessionMuteActuator(AudioSessionController& sessions, std::string process_name);

    bool ApplyMute(bool muted) override;
    std::string_view Name() const override { return "session"; }

private:
    AudioSessionController& sessions_;
    std::string process_name_;
};

} // namespace admute
