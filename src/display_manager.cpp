#include "display_manager.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <thread>

namespace ashface {

TransferResult DisplayManager::show(Expression e) {
    std::lock_guard<std::mutex> lock(mu_);
    TransferResult r = backend_.present(cache_.get(e));
    if (r != TransferResult::Ok) {
        spdlog::error("[Display] {} not shown: {}", to_string(e), to_string(r));
        return r;
    }
    current_ = e;
    spdlog::debug("[Display] expression {}", to_string(e));
    return r;
}

bool DisplayManager::show(std::string_view name) {
    auto e = expression_from_name(name);
    if (!e) {
        spdlog::warn("[Display] unknown expression '{}'", std::string(name));
        return false;
    }
    return show(*e) == TransferResult::Ok;
}

TransferResult DisplayManager::clear(Rgb color) {
    std::lock_guard<std::mutex> lock(mu_);
    TransferResult r = backend_.clear(color);
    if (r != TransferResult::Ok) {
        spdlog::error("[Display] clear failed: {}", to_string(r));
        return r;
    }
    current_.reset();
    return r;
}

std::optional<Expression> DisplayManager::current() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_;
}

TransferResult DisplayManager::tour(uint32_t delay_ms) {
    for (Expression e : kAllExpressions) {
        TransferResult r = show(e);
        if (r != TransferResult::Ok) return r;
        spdlog::info("[Display] showing {}", to_string(e));
        if (delay_ms) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    return TransferResult::Ok;
}

void DisplayManager::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return;
    closed_ = true;
    if (backend_.initialized()) {
        TransferResult r = backend_.clear(Rgb{});
        if (r != TransferResult::Ok) {
            spdlog::warn("[Display] final clear failed: {}", to_string(r));
        }
    }
    backend_.shutdown();
    current_.reset();
}

} // namespace ashface
