#pragma once

#include <string>

#include "display_backend.hpp"
#include "panel_config.hpp"

namespace ashface {

// Probe results, exposed for diagnostics. Empty string means usable.
std::string probe_hardware(const PanelConfig& cfg);
std::string probe_framebuffer(const PanelConfig& cfg);

// Brings up the first usable backend in priority order: ILI9486 over SPI,
// kernel framebuffer, simulation. Always returns an initialized backend.
DisplayBackend select_backend(const PanelConfig& cfg);

} // namespace ashface
