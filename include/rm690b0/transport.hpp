#pragma once

#include <cstddef>
#include <cstdint>

namespace rm690b0 {

// Number of data lines a transaction phase is clocked over
enum class DataMode : uint8_t { Single, Dual, Quad };

struct TransferCommand {
    uint16_t value{0};
    uint8_t bits{8};
    DataMode mode{DataMode::Single};
};

struct TransferAddress {
    uint32_t value{0};
    uint8_t bits{24};
    DataMode mode{DataMode::Single};
};

// Write-only serial link to the controller (SPI/QSPI/...).
// A transaction is: command phase, address phase, `dummy` idle clocks,
// then `len` payload bytes clocked in `data_mode`. Returns kOk or a
// binding-specific error code.
class Transport {
public:
    virtual ~Transport() = default;
    virtual int half_duplex_write(DataMode data_mode,
                                  const TransferCommand& command,
                                  const TransferAddress& address,
                                  uint8_t dummy,
                                  const uint8_t* data, size_t len) = 0;
};

} // namespace rm690b0
