#pragma once

#include <cstddef>
#include <cstdint>
#include "hardware/pio.h"
#include "rm690b0/transport.hpp"

namespace rm690b0 {

struct QspiPins {
    uint8_t sck;
    uint8_t sio0;   // SIO1..SIO3 must follow on consecutive GPIOs
    uint8_t cs;
};

// Quad SPI master on a PIO state machine. Quad payloads stream straight from
// memory by DMA; single-line phases are widened to one bit per nibble on SIO0.
class PioQspiTransport : public Transport {
public:
    PioQspiTransport(PIO pio, const QspiPins& pins, uint32_t sck_hz)
        : pio_(pio), pins_(pins), sck_hz_(sck_hz) {}

    bool init();
    int half_duplex_write(DataMode data_mode, const TransferCommand& command,
                          const TransferAddress& address, uint8_t dummy,
                          const uint8_t* data, size_t len) override;

private:
    void put_byte(uint8_t b);
    void put_single(uint32_t value, uint8_t bits);
    void write_quad_dma(const uint8_t* data, size_t len);
    void wait_idle();

    PIO pio_;
    QspiPins pins_;
    uint32_t sck_hz_;
    uint sm_ = 0;
    int dma_chan_ = -1;
};

} // namespace rm690b0
