#pragma once

#include <cstdint>
#include "rm690b0/reset.hpp"

namespace rm690b0 {

// Push-pull GPIO driven with gpio_put
class GpioOutputLine : public OutputLine {
public:
    GpioOutputLine(uint8_t pin, bool initial_high) : pin_(pin), initial_(initial_high) {}
    void init();
    int set_level(bool high) override;
private:
    uint8_t pin_;
    bool initial_;
};

class SleepDelay : public Delay {
public:
    void delay_ms(uint32_t ms) override;
};

} // namespace rm690b0
