#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "display_manager.hpp"
#include "expression_cache.hpp"
#include "panel_config.hpp"

namespace ashface {

class App {
public:
    explicit App(PanelConfig cfg = PanelConfig{}) : cfg_(std::move(cfg)) {}

    // Loads every face from faces_dir, then brings up a backend.
    // False if any face is missing or invalid.
    bool init(const std::string& faces_dir);

    // Shows each named expression in turn (all of them when names is empty),
    // hold_ms apart, then clears and shuts the panel down. Returns a process
    // exit code.
    int run(const std::vector<std::string>& names, uint32_t hold_ms = 2000);

    DisplayManager* display() { return display_.get(); }

private:
    PanelConfig cfg_;
    // Declared before display_: the manager holds a reference into it
    std::optional<ExpressionCache> cache_;
    std::unique_ptr<DisplayManager> display_;
};

} // namespace ashface
