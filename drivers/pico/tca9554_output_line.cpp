#include "tca9554_output_line.hpp"

#include "pico/stdlib.h"

namespace rm690b0 {

int Tca9554OutputLine::init() {
    int rc = read_reg(REG_OUTPUT, output_);
    if (rc != PICO_OK) return rc;
    rc = write_reg(REG_OUTPUT, static_cast<uint8_t>(output_ | mask_));
    if (rc != PICO_OK) return rc;
    output_ |= mask_;

    uint8_t config = 0xFF;
    rc = read_reg(REG_CONFIG, config);
    if (rc != PICO_OK) return rc;
    return write_reg(REG_CONFIG, static_cast<uint8_t>(config & ~mask_));
}

int Tca9554OutputLine::set_level(bool high) {
    uint8_t next = high ? (output_ | mask_) : (output_ & ~mask_);
    int rc = write_reg(REG_OUTPUT, next);
    if (rc != PICO_OK) return rc;
    output_ = next;
    return PICO_OK;
}

int Tca9554OutputLine::write_reg(uint8_t reg, uint8_t value) {
    uint8_t buf[2] = {reg, value};
    int n = i2c_write_blocking(i2c_, addr_, buf, 2, false);
    if (n < 0) return n;
    return n == 2 ? PICO_OK : PICO_ERROR_GENERIC;
}

int Tca9554OutputLine::read_reg(uint8_t reg, uint8_t& value) {
    int n = i2c_write_blocking(i2c_, addr_, &reg, 1, true);
    if (n < 0) return n;
    n = i2c_read_blocking(i2c_, addr_, &value, 1, false);
    if (n < 0) return n;
    return n == 1 ? PICO_OK : PICO_ERROR_GENERIC;
}

} // namespace rm690b0
