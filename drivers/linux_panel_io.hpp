#pragma once

#include "panel_io.hpp"
#include "spi_bus.hpp"
#include "gpio_line.hpp"

namespace ashface {

// PanelIo over /dev/spidevB.D plus three lines of /dev/gpiochipN
class LinuxPanelIo : public PanelIo {
public:
    LinuxPanelIo() = default;
    ~LinuxPanelIo() override { close(); }

    InitResult open(const PanelConfig& cfg) override;
    void close() override;
    bool set_dc(bool data) override { return dc_.set(data); }
    bool set_reset(bool high) override { return rst_.set(high); }
    bool set_backlight(bool on) override { return bl_.set(on); }
    bool write(const uint8_t* data, size_t len) override { return bus_.write(data, len); }
    size_t max_transfer() const override { return bus_.max_transfer(); }
    void delay_ms(uint32_t ms) override;

private:
    SpiBus bus_;
    GpioLine dc_;
    GpioLine rst_;
    GpioLine bl_;
};

} // namespace ashface
