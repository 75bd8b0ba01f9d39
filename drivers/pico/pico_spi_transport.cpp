#include "pico_spi_transport.hpp"

#include "pico/stdlib.h"
#include "hardware/dma.h"
#include "hardware/gpio.h"
#include "hardware/spi.h"

namespace rm690b0 {

namespace {
    // Payloads shorter than this are cheaper to push by hand than to set up DMA
    constexpr size_t kDmaThreshold = 32;

    size_t put_be(uint8_t* out, uint32_t value, uint8_t bits) {
        size_t n = bits / 8;
        for (size_t i = 0; i < n; ++i) {
            out[i] = static_cast<uint8_t>(value >> (8 * (n - 1 - i)));
        }
        return n;
    }
}

bool PicoSpiTransport::init() {
    gpio_init(cs_);
    gpio_set_dir(cs_, GPIO_OUT);
    gpio_put(cs_, 1);

    if (!bus_.init()) return false;

    if (dma_tx_chan_ < 0) {
        int ch = dma_claim_unused_channel(false);
        if (ch >= 0) {
            dma_tx_chan_ = ch;
            dma_channel_config c = dma_channel_get_default_config(ch);
            channel_config_set_transfer_data_size(&c, DMA_SIZE_8);
            channel_config_set_dreq(&c, spi_get_dreq(bus_.inst(), true));
            dma_channel_configure(ch, &c,
                &spi_get_hw(bus_.inst())->dr, // dst: SPI data register
                nullptr,                      // src set per transfer
                0,                            // count set per transfer
                false);
        }
    }
    return true;
}

int PicoSpiTransport::half_duplex_write(DataMode data_mode, const TransferCommand& command,
                                        const TransferAddress& address, uint8_t dummy,
                                        const uint8_t* data, size_t len) {
    if (data_mode != DataMode::Single || command.mode != DataMode::Single ||
        address.mode != DataMode::Single) {
        return PICO_ERROR_INVALID_ARG;
    }
    if (command.bits % 8 || command.bits > 16 || address.bits % 8 || address.bits > 32 || dummy % 8) {
        return PICO_ERROR_INVALID_ARG;
    }
    if (len && !data) return PICO_ERROR_INVALID_ARG;

    uint8_t header[2 + 4 + 32];
    size_t n = put_be(header, command.value, command.bits);
    n += put_be(header + n, address.value, address.bits);
    for (uint8_t i = 0; i < dummy / 8; ++i) header[n++] = 0;

    spi_inst_t* spi = bus_.inst();
    gpio_put(cs_, 0);
    spi_write_blocking(spi, header, n);
    if (len) {
        if (dma_tx_chan_ >= 0 && len >= kDmaThreshold) {
            write_dma(data, len);
        } else {
            spi_write_blocking(spi, data, len);
        }
    }
    gpio_put(cs_, 1);
    return PICO_OK;
}

void PicoSpiTransport::write_dma(const uint8_t* data, size_t len) {
    dma_channel_set_read_addr(dma_tx_chan_, data, false);
    dma_channel_set_trans_count(dma_tx_chan_, len, true);
    dma_channel_wait_for_finish_blocking(dma_tx_chan_);
    // Last byte may still be shifting out after the FIFO empties
    while (spi_is_busy(bus_.inst())) tight_loop_contents();
    drain_rx();
}

void PicoSpiTransport::drain_rx() {
    spi_hw_t* hw = spi_get_hw(bus_.inst());
    while (spi_is_readable(bus_.inst())) (void)hw->dr;
    hw->icr = SPI_SSPICR_RORIC_BITS;
}

} // namespace rm690b0
