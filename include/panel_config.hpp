#pragma once

#include <cstdint>
#include <string>

#include "boards/rpi_ili9486_pins.hpp"
#include "pixel_buffer.hpp"

namespace ashface {

// Panel rotation in 90 degree steps (maps to the controller's MADCTL register)
enum class Rotation : uint8_t { Deg0 = 0, Deg90 = 1, Deg180 = 2, Deg270 = 3 };

// Channel order of the 16-bit wire format
enum class ColorOrder : uint8_t { RGB, BGR };

struct PanelConfig {
    uint8_t spi_bus = pins::spi_bus;
    uint8_t spi_device = pins::spi_device;
    uint32_t spi_speed_hz = pins::spi_speed_hz;

    uint8_t gpio_chip = pins::gpio_chip;
    uint8_t pin_dc  = pins::lcd_dc;
    uint8_t pin_rst = pins::lcd_rst;
    uint8_t pin_bl  = pins::lcd_bl;

    Rotation rotation = Rotation::Deg90;
    ColorOrder color_order = ColorOrder::RGB;

    // Declared for validation; frames are always kPanelWidth x kPanelHeight
    uint16_t width  = kPanelWidth;
    uint16_t height = kPanelHeight;

    uint8_t fb_device = pins::fb_device;

    // Simulated backend writes each presented frame here as PNG (empty = off)
    std::string sim_snapshot_path;
};

std::string spidev_path(const PanelConfig& cfg);
std::string gpiochip_path(const PanelConfig& cfg);
std::string fbdev_path(const PanelConfig& cfg);

} // namespace ashface
