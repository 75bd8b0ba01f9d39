#include "pio_qspi_transport.hpp"

#include "pico/stdlib.h"
#include "hardware/clocks.h"
#include "hardware/dma.h"
#include "hardware/gpio.h"
#include "qspi_tx.pio.h"
#include "rm690b0/log.hpp"

namespace rm690b0 {

namespace {
    constexpr const char* TAG = "qspi";
}

bool PioQspiTransport::init() {
    gpio_init(pins_.cs);
    gpio_set_dir(pins_.cs, GPIO_OUT);
    gpio_put(pins_.cs, 1);

    if (!pio_can_add_program(pio_, &qspi_tx_program)) {
        RM690B0_LOGE(TAG, "no PIO instruction memory left");
        return false;
    }
    int sm = pio_claim_unused_sm(pio_, false);
    if (sm < 0) {
        RM690B0_LOGE(TAG, "no free state machine");
        return false;
    }
    sm_ = static_cast<uint>(sm);
    uint offset = pio_add_program(pio_, &qspi_tx_program);

    // Two PIO cycles per SCK period
    float clkdiv = static_cast<float>(clock_get_hz(clk_sys)) / (2.0f * static_cast<float>(sck_hz_));
    if (clkdiv < 1.0f) clkdiv = 1.0f;
    qspi_tx_program_init(pio_, sm_, offset, pins_.sio0, pins_.sck, clkdiv);

    dma_chan_ = dma_claim_unused_channel(false);
    if (dma_chan_ < 0) {
        RM690B0_LOGE(TAG, "no free DMA channel");
        pio_sm_set_enabled(pio_, sm_, false);
        pio_remove_program(pio_, &qspi_tx_program, offset);
        pio_sm_unclaim(pio_, sm_);
        return false;
    }
    dma_channel_config c = dma_channel_get_default_config(dma_chan_);
    channel_config_set_transfer_data_size(&c, DMA_SIZE_8);
    channel_config_set_read_increment(&c, true);
    channel_config_set_write_increment(&c, false);
    channel_config_set_dreq(&c, pio_get_dreq(pio_, sm_, true));
    dma_channel_configure(dma_chan_, &c,
        &pio_->txf[sm_], // dst: TX FIFO, byte lane replicated
        nullptr,         // src set per transfer
        0,               // count set per transfer
        false);

    RM690B0_LOGI(TAG, "PIO QSPI on sm %u, sck %lu Hz", sm_, static_cast<unsigned long>(sck_hz_));
    return true;
}

int PioQspiTransport::half_duplex_write(DataMode data_mode, const TransferCommand& command,
                                        const TransferAddress& address, uint8_t dummy,
                                        const uint8_t* data, size_t len) {
    if (data_mode == DataMode::Dual || command.mode != DataMode::Single || address.mode != DataMode::Single) {
        return PICO_ERROR_INVALID_ARG;
    }
    if (command.bits % 8 || command.bits > 16 || address.bits % 8 || address.bits > 32 || dummy % 2) {
        return PICO_ERROR_INVALID_ARG;
    }
    if (len && !data) return PICO_ERROR_INVALID_ARG;
    if (dma_chan_ < 0) return PICO_ERROR_GENERIC;

    gpio_put(pins_.cs, 0);
    put_single(command.value, command.bits);
    put_single(address.value, address.bits);
    // Dummy clocks: one nibble each
    for (uint8_t i = 0; i < dummy / 2; ++i) put_byte(0);

    if (len) {
        if (data_mode == DataMode::Quad) {
            write_quad_dma(data, len);
        } else {
            for (size_t i = 0; i < len; ++i) put_single(data[i], 8);
        }
    }
    wait_idle();
    gpio_put(pins_.cs, 1);
    return PICO_OK;
}

void PioQspiTransport::put_byte(uint8_t b) {
    while (pio_sm_is_tx_fifo_full(pio_, sm_)) tight_loop_contents();
    *reinterpret_cast<io_rw_8*>(&pio_->txf[sm_]) = b;
}

// Each bit becomes a nibble with only SIO0 set, two bits per FIFO byte
void PioQspiTransport::put_single(uint32_t value, uint8_t bits) {
    for (int bit = bits - 1; bit > 0; bit -= 2) {
        uint8_t hi = (value >> bit) & 1u;
        uint8_t lo = (value >> (bit - 1)) & 1u;
        put_byte(static_cast<uint8_t>((hi << 4) | lo));
    }
}

void PioQspiTransport::write_quad_dma(const uint8_t* data, size_t len) {
    dma_channel_set_read_addr(dma_chan_, data, false);
    dma_channel_set_trans_count(dma_chan_, len, true);
    dma_channel_wait_for_finish_blocking(dma_chan_);
}

// FIFO empty and the state machine stalled on its next pull
void PioQspiTransport::wait_idle() {
    const uint32_t stall = 1u << (PIO_FDEBUG_TXSTALL_LSB + sm_);
    pio_->fdebug = stall;
    // The stalled `out` still drives its side-set, so SCK rests low
    while (!pio_sm_is_tx_fifo_empty(pio_, sm_) || !(pio_->fdebug & stall)) tight_loop_contents();
}

} // namespace rm690b0
