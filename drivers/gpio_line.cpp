#include "gpio_line.hpp"
#include "linux_device.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ashface {

InitResult GpioLine::request(const std::string& chip_path, uint32_t offset, bool initial_high,
                             const char* consumer) {
    release();
    int chip = ::open(chip_path.c_str(), O_RDWR | O_CLOEXEC);
    if (chip < 0) {
        int err = errno;
        spdlog::debug("[Gpio] open {} failed: {}", chip_path, std::strerror(err));
        return init_result_from_errno(err);
    }

    gpio_v2_line_request req;
    std::memset(&req, 0, sizeof(req));
    req.offsets[0] = offset;
    req.num_lines = 1;
    std::strncpy(req.consumer, consumer, GPIO_MAX_NAME_SIZE - 1);
    req.config.flags = GPIO_V2_LINE_FLAG_OUTPUT;
    req.config.num_attrs = 1;
    req.config.attrs[0].mask = 1;
    req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
    req.config.attrs[0].attr.values = initial_high ? 1 : 0;

    int rc = ioctl(chip, GPIO_V2_GET_LINE_IOCTL, &req);
    int err = errno;
    ::close(chip);
    if (rc < 0) {
        spdlog::error("[Gpio] {} line {} ({}) request failed: {}", chip_path, offset, consumer,
                      std::strerror(err));
        return init_result_from_errno(err);
    }
    fd_ = req.fd;
    offset_ = offset;
    return InitResult::Ok;
}

bool GpioLine::set(bool high) {
    if (fd_ < 0) return false;
    gpio_v2_line_values values;
    std::memset(&values, 0, sizeof(values));
    values.mask = 1;
    values.bits = high ? 1 : 0;
    if (ioctl(fd_, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0) {
        spdlog::error("[Gpio] line {} set {} failed: {}", offset_, high ? 1 : 0, std::strerror(errno));
        return false;
    }
    return true;
}

void GpioLine::release() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace ashface
