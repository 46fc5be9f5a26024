#include "backend_selector.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <unistd.h>

#include "drivers/linux_panel_io.hpp"

namespace ashface {

std::string probe_hardware(const PanelConfig& cfg) {
    const std::string spi = spidev_path(cfg);
    const std::string chip = gpiochip_path(cfg);
    if (access(spi.c_str(), F_OK) != 0) return spi + " not present";
    if (access(chip.c_str(), F_OK) != 0) return chip + " not present";
    return {};
}

std::string probe_framebuffer(const PanelConfig& cfg) {
    const std::string fb = fbdev_path(cfg);
    if (access(fb.c_str(), F_OK) != 0) return fb + " not present";
    if (access(fb.c_str(), W_OK) != 0) return fb + " not writable";
    return {};
}

DisplayBackend select_backend(const PanelConfig& cfg) {
    std::string skipped;
    auto note = [&](const char* backend, const std::string& why) {
        spdlog::warn("[Selector] {} unavailable: {}", backend, why);
        if (!skipped.empty()) skipped += "; ";
        skipped += std::string(backend) + ": " + why;
    };

    std::string why = probe_hardware(cfg);
    if (why.empty()) {
        Ili9486Display hw(std::make_unique<LinuxPanelIo>());
        InitResult r = hw.init(cfg);
        if (r == InitResult::Ok) {
            spdlog::info("[Selector] using {}", to_string(BackendKind::Hardware));
            return DisplayBackend(std::move(hw));
        }
        note(to_string(BackendKind::Hardware), std::string("init failed: ") + to_string(r));
    } else {
        note(to_string(BackendKind::Hardware), why);
    }

    why = probe_framebuffer(cfg);
    if (why.empty()) {
        FbdevDisplay fb;
        InitResult r = fb.init(cfg);
        if (r == InitResult::Ok) {
            spdlog::info("[Selector] using {} ({})", to_string(BackendKind::FramebufferDevice), skipped);
            return DisplayBackend(std::move(fb));
        }
        note(to_string(BackendKind::FramebufferDevice), std::string("init failed: ") + to_string(r));
    } else {
        note(to_string(BackendKind::FramebufferDevice), why);
    }

    SimDisplay sim;
    if (sim.init(cfg) != InitResult::Ok) {
        spdlog::error("[Selector] simulated panel reported an init failure");
    }
    spdlog::info("[Selector] using {} ({})", to_string(BackendKind::Simulated), skipped);
    return DisplayBackend(std::move(sim));
}

} // namespace ashface
