#pragma once

#include <cstddef>
#include <cstdint>

namespace rm690b0 {

// The three primitives the RM690B0 understands. Implementations map them
// onto whatever bus the panel is wired to and return kOk or the bus's code.
class ControllerInterface {
public:
    virtual ~ControllerInterface() = default;
    virtual int send_command(uint8_t cmd) = 0;
    virtual int send_command_with_data(uint8_t cmd, const uint8_t* data, size_t len) = 0;
    // Streams a memory-write burst into the current window
    virtual int send_pixels(const uint8_t* pixels, size_t len) = 0;
};

} // namespace rm690b0
