#pragma once

#include <cstddef>
#include <cstdint>
#include "rm690b0/transport.hpp"
#include "spi_bus.hpp"

namespace rm690b0 {

// 4-wire SPI link (single data line). Header bytes go out by programmed IO,
// payloads by DMA when a channel could be claimed. Dual/quad phases are
// rejected with PICO_ERROR_INVALID_ARG; pair it with kSpiProtocol.
class PicoSpiTransport : public Transport {
public:
    PicoSpiTransport(SpiBus& bus, uint8_t pin_cs) : bus_(bus), cs_(pin_cs) {}

    bool init();
    int half_duplex_write(DataMode data_mode, const TransferCommand& command,
                          const TransferAddress& address, uint8_t dummy,
                          const uint8_t* data, size_t len) override;

private:
    void write_dma(const uint8_t* data, size_t len);
    void drain_rx();

    SpiBus& bus_;
    uint8_t cs_;
    int dma_tx_chan_ = -1;
};

} // namespace rm690b0
