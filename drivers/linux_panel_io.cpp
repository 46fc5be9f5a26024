#include "linux_panel_io.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

namespace ashface {

InitResult LinuxPanelIo::open(const PanelConfig& cfg) {
    close();
    const std::string spi = spidev_path(cfg);
    const std::string chip = gpiochip_path(cfg);

    InitResult r = bus_.open(spi, cfg.spi_speed_hz);
    if (r != InitResult::Ok) return r;

    // DC starts in command mode, RST released, backlight dark until init completes
    if ((r = dc_.request(chip, cfg.pin_dc, false, "ashface-dc")) != InitResult::Ok ||
        (r = rst_.request(chip, cfg.pin_rst, true, "ashface-rst")) != InitResult::Ok ||
        (r = bl_.request(chip, cfg.pin_bl, false, "ashface-bl")) != InitResult::Ok) {
        close();
        return r;
    }
    spdlog::info("[PanelIo] {} @ {} MHz, {} DC={} RST={} BL={}", spi, bus_.frequency() / 1000000,
                 chip, cfg.pin_dc, cfg.pin_rst, cfg.pin_bl);
    return InitResult::Ok;
}

void LinuxPanelIo::close() {
    const bool was_open = bus_.is_open();
    bl_.release();
    rst_.release();
    dc_.release();
    bus_.close();
    if (was_open) spdlog::debug("[PanelIo] released");
}

void LinuxPanelIo::delay_ms(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace ashface
