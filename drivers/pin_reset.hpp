#pragma once

#include <cstdint>
#include "rm690b0/reset.hpp"

namespace rm690b0 {

// Reset by pulsing an output line: low, hold, high, settle.
class PinReset : public ResetInterface {
public:
    PinReset(OutputLine& line, Delay& delay, uint32_t low_ms = 20, uint32_t high_ms = 150)
        : line_(line), delay_(delay), low_ms_(low_ms), high_ms_(high_ms) {}

    int reset() override;

private:
    OutputLine& line_;
    Delay& delay_;
    uint32_t low_ms_;
    uint32_t high_ms_;
};

} // namespace rm690b0
