#pragma once

#include <cstdint>

namespace ashface {

// Backend bring-up outcome
enum class InitResult : uint8_t {
    Ok = 0,
    DeviceNotFound,   // bus, gpiochip or framebuffer node missing
    PermissionDenied,
    BadConfig,        // pin or rotation configuration rejected
    GeometryMismatch, // device reports a different size or pixel depth
    IoError,
};

// Per-frame outcome of present()/clear()
enum class TransferResult : uint8_t {
    Ok = 0,
    NotInitialized,
    IoError,
};

enum class BackendKind : uint8_t { Hardware, FramebufferDevice, Simulated };

const char* to_string(InitResult r);
const char* to_string(TransferResult r);
const char* to_string(BackendKind k);

} // namespace ashface
