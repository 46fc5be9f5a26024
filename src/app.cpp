#include "app.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <thread>

#include "backend_selector.hpp"

namespace ashface {

bool App::init(const std::string& faces_dir) {
    // A second init replaces everything; the old manager references the old cache
    display_.reset();
    cache_.reset();

    auto loaded = ExpressionCache::load(faces_dir);
    if (auto* err = std::get_if<LoadError>(&loaded)) {
        spdlog::critical("[App] cannot load face '{}' from {}: {}", to_string(err->which), err->path,
                         to_string(err->kind));
        return false;
    }
    cache_.emplace(std::move(std::get<ExpressionCache>(loaded)));

    display_ = std::make_unique<DisplayManager>(select_backend(cfg_), *cache_);
    spdlog::info("[App] ready on {}", to_string(display_->backend_kind()));
    return true;
}

int App::run(const std::vector<std::string>& names, uint32_t hold_ms) {
    if (!display_) {
        spdlog::error("[App] run() before init()");
        return 1;
    }

    int rc = 0;
    if (names.empty()) {
        if (display_->tour(hold_ms) != TransferResult::Ok) rc = 1;
    } else {
        for (const std::string& name : names) {
            if (!display_->show(name)) {
                rc = 1;
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
        }
    }

    display_->close();
    return rc;
}

} // namespace ashface
