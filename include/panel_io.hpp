#pragma once

#include <cstddef>
#include <cstdint>

#include "display.hpp"
#include "panel_config.hpp"

namespace ashface {

// Abstract link to a command/data panel controller: a write-only serial bus
// plus data/command select, reset and backlight lines.
class PanelIo {
public:
    virtual ~PanelIo() = default;
    virtual InitResult open(const PanelConfig& cfg) = 0;
    virtual void close() = 0;
    virtual bool set_dc(bool data) = 0;     // false = command, true = data
    virtual bool set_reset(bool high) = 0;
    virtual bool set_backlight(bool on) = 0;
    virtual bool write(const uint8_t* data, size_t len) = 0; // blocks until sent
    virtual size_t max_transfer() const = 0;                  // bytes per write()
    virtual void delay_ms(uint32_t ms) = 0;
};

} // namespace ashface
