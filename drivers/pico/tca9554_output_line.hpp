#pragma once

#include <cstdint>
#include "hardware/i2c.h"
#include "rm690b0/reset.hpp"

namespace rm690b0 {

// One pin of a TCA9554 8-bit I2C expander. Keeps a shadow of the output
// register so the other pins are not disturbed.
class Tca9554OutputLine : public OutputLine {
public:
    Tca9554OutputLine(i2c_inst_t* i2c, uint8_t address, uint8_t pin)
        : i2c_(i2c), addr_(address), mask_(static_cast<uint8_t>(1u << pin)) {}

    // Drives the pin high and switches it to output; PICO_OK or the I2C error
    int init();
    int set_level(bool high) override;

private:
    static constexpr uint8_t REG_OUTPUT = 0x01;
    static constexpr uint8_t REG_CONFIG = 0x03;   // 1 = input

    int write_reg(uint8_t reg, uint8_t value);
    int read_reg(uint8_t reg, uint8_t& value);

    i2c_inst_t* i2c_;
    uint8_t addr_;
    uint8_t mask_;
    uint8_t output_ = 0xFF;
};

} // namespace rm690b0
