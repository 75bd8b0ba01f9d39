#pragma once

#include <cstdint>

namespace rm690b0 {

// Collaborators (transport, reset line) report 0 on success and a
// binding-specific non-zero code otherwise, as the Pico SDK does.
constexpr int kOk = 0;

enum class ErrorKind : uint8_t {
    None,
    Interface,             // transport rejected a transaction
    Reset,                 // reset line could not be driven
    InvalidConfiguration,  // caller supplied geometry or storage the panel cannot take
};

const char* to_string(ErrorKind kind);

struct Status {
    ErrorKind kind = ErrorKind::None;
    int code = kOk;                 // collaborator code for Interface/Reset
    const char* message = nullptr;  // static string, never owned

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return Status{}; }
    static Status interface_error(int code, const char* message = "transport write failed") {
        return Status{ErrorKind::Interface, code, message};
    }
    static Status reset_error(int code, const char* message = "reset line failed") {
        return Status{ErrorKind::Reset, code, message};
    }
    static Status invalid_configuration(const char* message) {
        return Status{ErrorKind::InvalidConfiguration, kOk, message};
    }
};

} // namespace rm690b0
