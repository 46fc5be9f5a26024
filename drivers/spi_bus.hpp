#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "display.hpp"

namespace ashface {

// Write-only SPI master over Linux spidev (mode 0, 8-bit words)
class SpiBus {
public:
    static constexpr size_t kDefaultMaxTransfer = 4096; // spidev bufsiz default

    SpiBus() = default;
    ~SpiBus() { close(); }
    SpiBus(const SpiBus&) = delete;
    SpiBus& operator=(const SpiBus&) = delete;

    InitResult open(const std::string& path, uint32_t hz);
    void close();
    bool is_open() const { return fd_ >= 0; }

    // len must not exceed max_transfer()
    bool write(const uint8_t* data, size_t len);

    // Attempt to change SPI frequency at runtime; returns actual set rate
    uint32_t set_frequency(uint32_t hz);
    uint32_t frequency() const { return hz_; }
    size_t max_transfer() const { return max_transfer_; }

private:
    int fd_ = -1;
    uint32_t hz_ = 0;
    size_t max_transfer_ = kDefaultMaxTransfer;
};

} // namespace ashface
