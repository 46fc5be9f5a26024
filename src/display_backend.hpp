#pragma once

#include <variant>

#include "display.hpp"
#include "panel_config.hpp"
#include "pixel_buffer.hpp"
#include "drivers/ili9486_display.hpp"
#include "drivers/fbdev_display.hpp"
#include "drivers/sim_display.hpp"

namespace ashface {

// The live display: exactly one of the three backends, behind one call surface.
// Not thread-safe; callers serialize (see DisplayManager).
class DisplayBackend {
public:
    using Variant = std::variant<Ili9486Display, FbdevDisplay, SimDisplay>;

    explicit DisplayBackend(Ili9486Display d) : impl_(std::move(d)) {}
    explicit DisplayBackend(FbdevDisplay d) : impl_(std::move(d)) {}
    explicit DisplayBackend(SimDisplay d) : impl_(std::move(d)) {}
    DisplayBackend(DisplayBackend&&) = default;

    InitResult init(const PanelConfig& cfg);
    TransferResult present(const PixelBuffer& frame);
    TransferResult clear(Rgb color);
    void shutdown();

    bool initialized() const;
    BackendKind kind() const;
    const char* name() const { return to_string(kind()); }

    template <typename T> T* get_if() { return std::get_if<T>(&impl_); }
    template <typename T> const T* get_if() const { return std::get_if<T>(&impl_); }

private:
    Variant impl_;
};

} // namespace ashface
