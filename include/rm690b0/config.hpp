#pragma once

#include <cstddef>
#include <cstdint>
#include "types.hpp"
#include "transport.hpp"

namespace rm690b0 {

// Opcodes and limits of the serial protocol wrapped around every command
struct ProtocolConfig {
    uint8_t control_opcode = 0x02;          // register writes, single line
    uint8_t pixel_opcode = 0x32;            // memory writes
    DataMode pixel_data_mode = DataMode::Quad;
    size_t max_chunk_size = 16380;          // largest payload one transaction may carry
};

// Single-line SPI wiring: same framing, pixels go out with the control opcode
constexpr ProtocolConfig kSpiProtocol{0x02, 0x02, DataMode::Single, 16380};

struct PanelConfig {
    DisplaySize size{450, 600};
    ColorMode color = ColorMode::Rgb888;
    // Columns addressable through CASET; the RM690B0 RAM is wider than most glass
    uint16_t max_column_count = 480;
    uint32_t reset_low_ms = 20;
    uint32_t reset_high_ms = 150;
    uint32_t sleep_out_settle_ms = 120;     // after SLPOUT during init
    uint32_t display_on_settle_ms = 20;
    uint32_t sleep_settle_ms = 5;           // sleep_in()/sleep_out() at runtime
    uint8_t initial_brightness = 0xFF;
};

} // namespace rm690b0
