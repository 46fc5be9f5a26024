#include "display.hpp"
#include "panel_config.hpp"

namespace ashface {

const char* to_string(InitResult r) {
    switch (r) {
    case InitResult::Ok:               return "ok";
    case InitResult::DeviceNotFound:   return "device not found";
    case InitResult::PermissionDenied: return "permission denied";
    case InitResult::BadConfig:        return "bad configuration";
    case InitResult::GeometryMismatch: return "geometry mismatch";
    case InitResult::IoError:          return "I/O error";
    }
    return "?";
}

const char* to_string(TransferResult r) {
    switch (r) {
    case TransferResult::Ok:             return "ok";
    case TransferResult::NotInitialized: return "not initialized";
    case TransferResult::IoError:        return "I/O error";
    }
    return "?";
}

const char* to_string(BackendKind k) {
    switch (k) {
    case BackendKind::Hardware:          return "ili9486-spi";
    case BackendKind::FramebufferDevice: return "fbdev";
    case BackendKind::Simulated:         return "simulated";
    }
    return "?";
}

std::string spidev_path(const PanelConfig& cfg) {
    return "/dev/spidev" + std::to_string(cfg.spi_bus) + "." + std::to_string(cfg.spi_device);
}

std::string gpiochip_path(const PanelConfig& cfg) {
    return "/dev/gpiochip" + std::to_string(cfg.gpio_chip);
}

std::string fbdev_path(const PanelConfig& cfg) {
    return "/dev/fb" + std::to_string(cfg.fb_device);
}

} // namespace ashface
