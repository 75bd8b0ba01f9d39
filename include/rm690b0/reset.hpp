#pragma once

#include <cstdint>

namespace rm690b0 {

// Blocking millisecond wait
class Delay {
public:
    virtual ~Delay() = default;
    virtual void delay_ms(uint32_t ms) = 0;
};

// A single digital output, either a GPIO or a pin behind an expander
class OutputLine {
public:
    virtual ~OutputLine() = default;
    virtual int set_level(bool high) = 0;
};

// Performs the panel's hardware reset sequence; kOk or the line's error code
class ResetInterface {
public:
    virtual ~ResetInterface() = default;
    virtual int reset() = 0;
};

} // namespace rm690b0
