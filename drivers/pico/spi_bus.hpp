#pragma once

#include <cstdint>
#include "hardware/spi.h"

namespace rm690b0 {

class SpiBus {
public:
    SpiBus(spi_inst_t* inst, uint32_t hz) : inst_(inst), hz_(hz) {}
    // Mode 0, MSB first; returns false if the peripheral could not reach a usable rate
    bool init() {
        hz_ = spi_init(inst_, hz_);
        spi_set_format(inst_, 8, SPI_CPOL_0, SPI_CPHA_0, SPI_MSB_FIRST);
        return hz_ != 0;
    }
    spi_inst_t* inst() const { return inst_; }
    uint32_t frequency() const { return hz_; }
    // Returns the rate actually set
    uint32_t set_frequency(uint32_t hz) { hz_ = spi_set_baudrate(inst_, hz); return hz_; }
private:
    spi_inst_t* inst_;
    uint32_t hz_;
};

} // namespace rm690b0
