#pragma once

#include <cstdint>

// Raspberry Pi + 3.5" ILI9486 SPI module. Guides for these modules disagree on
// DC/RST (24/25 vs 25/27); confirm against the actual board.
namespace ashface::pins {

// /dev/spidev<spi_bus>.<spi_device>
constexpr uint8_t spi_bus    = 0;
constexpr uint8_t spi_device = 0; // CE0
constexpr uint32_t spi_speed_hz = 32 * 1000 * 1000;

// /dev/gpiochip<gpio_chip> (Pi 5 on older kernels exposes the header on gpiochip4)
constexpr uint8_t gpio_chip = 0;

constexpr uint8_t lcd_dc  = 24;
constexpr uint8_t lcd_rst = 25;
constexpr uint8_t lcd_bl  = 18;

// /dev/fb<fb_device> when the kernel owns the panel (fbtft / LCD-show overlays)
constexpr uint8_t fb_device = 1;

} // namespace ashface::pins
