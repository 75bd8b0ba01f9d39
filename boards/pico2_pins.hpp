#pragma once

#include <cstdint>
#include "rm690b0/config.hpp"

// Raspberry Pi Pico 2 wired to a 450x600 RM690B0 AMOLED module over QSPI
namespace rm690b0::board {

// Quad bus on PIO0, or plain SPI0 when only SIO0 is wired
constexpr bool quad_bus = true;

// QSPI (PIO0); SIO1..SIO3 follow SIO0 on consecutive GPIOs
constexpr uint8_t qspi_sck  = 18;
constexpr uint8_t qspi_sio0 = 19; // 19..22
constexpr uint8_t qspi_cs   = 17;
constexpr uint32_t qspi_hz  = 40 * 1000 * 1000;

// SPI0 alternative: SCK/MOSI on the QSPI SCK/SIO0 pads
constexpr uint32_t spi_hz = 40 * 1000 * 1000;

// Panel control
constexpr uint8_t panel_rst = 16;
constexpr uint8_t panel_en  = 15; // AMOLED supply enable, active high

// Modules that route reset through a TCA9554 instead of a GPIO
constexpr bool reset_via_expander = false;
constexpr uint8_t i2c_sda = 4;
constexpr uint8_t i2c_scl = 5;
constexpr uint32_t i2c_hz = 400 * 1000;
constexpr uint8_t expander_addr = 0x20;
constexpr uint8_t expander_rst_pin = 1;

// Gray8 keeps the whole frame in the RP2350's 520 KB of SRAM
constexpr PanelConfig panel{
    DisplaySize{450, 600},
    ColorMode::Gray8,
    480,        // max_column_count
    20, 150,    // reset low/high ms
    120, 20, 5, // settle: sleep out, display on, sleep in/out
    0xFF,       // brightness
};

constexpr ProtocolConfig protocol = quad_bus ? ProtocolConfig{} : kSpiProtocol;

} // namespace rm690b0::board
