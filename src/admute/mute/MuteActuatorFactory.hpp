#pragma once

#include "IMuteActuator.hpp"
#include "MuteMethod.hpp"

#include <memory>
#include <string>

namespace admute
{

class AdDetector;
class AudioSessionController;

class MuteActuatorFactory
{
public:
    // nullptr (with a Fatal report) when the method's backing API is not
    // available. `sessions` may be null for the click method.
    static std::unique_ptr<IMuteActuator> Create(MuteMethod method, AdDetector& detector,
                                                 AudioSessionController* sessions,
                                                 const std::string& process_name);
};

} // namespace admute
