#include "display_backend.hpp"

namespace ashface {

InitResult DisplayBackend::init(const PanelConfig& cfg) {
    return std::visit([&](auto& d) { return d.init(cfg); }, impl_);
}

TransferResult DisplayBackend::present(const PixelBuffer& frame) {
    return std::visit([&](auto& d) { return d.present(frame); }, impl_);
}

TransferResult DisplayBackend::clear(Rgb color) {
    return std::visit([&](auto& d) { return d.clear(color); }, impl_);
}

void DisplayBackend::shutdown() {
    std::visit([](auto& d) { d.shutdown(); }, impl_);
}

bool DisplayBackend::initialized() const {
    return std::visit([](const auto& d) { return d.initialized(); }, impl_);
}

BackendKind DisplayBackend::kind() const {
    switch (impl_.index()) {
    case 0:  return BackendKind::Hardware;
    case 1:  return BackendKind::FramebufferDevice;
    default: return BackendKind::Simulated;
    }
}

} // namespace ashface
