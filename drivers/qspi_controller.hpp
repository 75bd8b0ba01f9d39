#pragma once

#include <cstddef>
#include <cstdint>
#include "rm690b0/config.hpp"
#include "rm690b0/controller_interface.hpp"
#include "rm690b0/transport.hpp"

namespace rm690b0 {

// Lowers RM690B0 primitives onto opcode/address/payload transactions:
// the command byte rides in bits 15..8 of a 24-bit address.
class QspiController : public ControllerInterface {
public:
    explicit QspiController(Transport& transport, const ProtocolConfig& config = ProtocolConfig{})
        : transport_(transport), config_(config) {}

    int send_command(uint8_t cmd) override;
    int send_command_with_data(uint8_t cmd, const uint8_t* data, size_t len) override;
    // Splits into max_chunk_size transactions; the first is addressed RAMWR,
    // the rest RAMWRC so the controller continues the same burst.
    int send_pixels(const uint8_t* pixels, size_t len) override;

    const ProtocolConfig& config() const { return config_; }

    static constexpr uint32_t command_address(uint8_t cmd) { return static_cast<uint32_t>(cmd) << 8; }

private:
    Transport& transport_;
    ProtocolConfig config_;
};

} // namespace rm690b0
