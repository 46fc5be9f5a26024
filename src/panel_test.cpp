// Panel bring-up: solid fills, then the happy face when faces are available.
// ashface_panel_test [faces_dir]
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>
#include <utility>
#include <variant>

#include "backend_selector.hpp"
#include "expression_cache.hpp"

using namespace ashface;

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    PanelConfig cfg;
    DisplayBackend display = select_backend(cfg);
    spdlog::info("[PanelTest] backend {}", display.name());

    static constexpr std::pair<const char*, Rgb> kFills[] = {
        {"black", {0x00, 0x00, 0x00}}, {"white", {0xFF, 0xFF, 0xFF}}, {"red", {0xFF, 0x00, 0x00}},
        {"green", {0x00, 0xFF, 0x00}}, {"blue", {0x00, 0x00, 0xFF}},
    };

    int rc = 0;
    for (const auto& fill : kFills) {
        spdlog::info("[PanelTest] {}", fill.first);
        TransferResult r = display.clear(fill.second);
        if (r != TransferResult::Ok) {
            spdlog::error("[PanelTest] {} fill failed: {}", fill.first, to_string(r));
            rc = 1;
            break;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    if (rc == 0 && argc > 1) {
        auto loaded = ExpressionCache::load(argv[1]);
        if (auto* err = std::get_if<LoadError>(&loaded)) {
            spdlog::warn("[PanelTest] skipping face: {} ({})", err->path, to_string(err->kind));
        } else {
            const auto& cache = std::get<ExpressionCache>(loaded);
            TransferResult r = display.present(cache.get(Expression::Happy));
            if (r != TransferResult::Ok) {
                spdlog::error("[PanelTest] happy face failed: {}", to_string(r));
                rc = 1;
            } else {
                std::this_thread::sleep_for(std::chrono::seconds(3));
            }
        }
    }

    display.shutdown();
    return rc;
}
