#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

#include "display_backend.hpp"
#include "expression.hpp"
#include "expression_cache.hpp"

namespace ashface {

// Single owner of the live backend. All backend calls go through one mutex so
// the display can be driven from any thread; the cache is shared read-only.
class DisplayManager {
public:
    DisplayManager(DisplayBackend backend, const ExpressionCache& cache)
        : backend_(std::move(backend)), cache_(cache) {}
    ~DisplayManager() { close(); }
    DisplayManager(const DisplayManager&) = delete;
    DisplayManager& operator=(const DisplayManager&) = delete;

    TransferResult show(Expression e);
    bool show(std::string_view name);
    TransferResult clear(Rgb color = Rgb{});
    std::optional<Expression> current() const;

    // Shows every expression in order, delay_ms apart
    TransferResult tour(uint32_t delay_ms);

    // Clears to black and releases the backend; later calls return NotInitialized
    void close();

    BackendKind backend_kind() const { return backend_.kind(); }

    template <typename Fn> auto with_backend(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mu_);
        return fn(backend_);
    }

private:
    mutable std::mutex mu_;
    DisplayBackend backend_;
    const ExpressionCache& cache_;
    std::optional<Expression> current_;
    bool closed_ = false;
};

} // namespace ashface
