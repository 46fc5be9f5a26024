#pragma once

#include <cstdint>
#include <string>

#include "display.hpp"

namespace ashface {

// Single output line requested through the GPIO character device (uAPI v2).
// The kernel holds the requested value until release().
class GpioLine {
public:
    GpioLine() = default;
    ~GpioLine() { release(); }
    GpioLine(const GpioLine&) = delete;
    GpioLine& operator=(const GpioLine&) = delete;

    InitResult request(const std::string& chip_path, uint32_t offset, bool initial_high,
                       const char* consumer);
    bool set(bool high);
    void release();

private:
    int fd_ = -1;
    uint32_t offset_ = 0;
};

} // namespace ashface
