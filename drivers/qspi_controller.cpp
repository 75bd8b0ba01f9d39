#include "qspi_controller.hpp"

#include "rm690b0/commands.hpp"
#include "rm690b0/status.hpp"

namespace rm690b0 {

int QspiController::send_command(uint8_t cmd) {
    return send_command_with_data(cmd, nullptr, 0);
}

int QspiController::send_command_with_data(uint8_t cmd, const uint8_t* data, size_t len) {
    const TransferCommand op{config_.control_opcode, 8, DataMode::Single};
    const TransferAddress addr{command_address(cmd), 24, DataMode::Single};
    return transport_.half_duplex_write(DataMode::Single, op, addr, 0, data, len);
}

int QspiController::send_pixels(const uint8_t* pixels, size_t len) {
    const TransferCommand op{config_.pixel_opcode, 8, DataMode::Single};
    const size_t chunk = config_.max_chunk_size ? config_.max_chunk_size : len;
    size_t offset = 0;
    while (offset < len) {
        size_t n = len - offset;
        if (n > chunk) n = chunk;
        const uint8_t cmd = offset == 0 ? commands::RAMWR : commands::RAMWRC;
        const TransferAddress addr{command_address(cmd), 24, DataMode::Single};
        int rc = transport_.half_duplex_write(config_.pixel_data_mode, op, addr, 0, pixels + offset, n);
        if (rc != kOk) return rc;
        offset += n;
    }
    return kOk;
}

} // namespace rm690b0
