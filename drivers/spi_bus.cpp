#include "spi_bus.hpp"
#include "linux_device.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ashface {

namespace {

// spidev refuses single messages larger than its bufsiz module parameter
size_t read_spidev_bufsiz() {
    std::ifstream file("/sys/module/spidev/parameters/bufsiz");
    size_t value = 0;
    if (!(file >> value) || value == 0) return SpiBus::kDefaultMaxTransfer;
    return value;
}

} // namespace

InitResult SpiBus::open(const std::string& path, uint32_t hz) {
    close();
    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        spdlog::debug("[SpiBus] open {} failed: {}", path, std::strerror(err));
        return init_result_from_errno(err);
    }

    uint8_t mode = SPI_MODE_0;
    uint8_t bits = 8;
    if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 || ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0) {
        int err = errno;
        spdlog::error("[SpiBus] {}: cannot set mode 0 / 8 bit: {}", path, std::strerror(err));
        ::close(fd);
        return init_result_from_errno(err);
    }

    fd_ = fd;
    max_transfer_ = read_spidev_bufsiz();
    if (set_frequency(hz) == 0) {
        close();
        return InitResult::IoError;
    }
    spdlog::debug("[SpiBus] {} open at {} Hz, max transfer {} bytes", path, hz_, max_transfer_);
    return InitResult::Ok;
}

void SpiBus::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SpiBus::write(const uint8_t* data, size_t len) {
    if (fd_ < 0) return false;
    if (!data || !len) return true;

    spi_ioc_transfer tr;
    std::memset(&tr, 0, sizeof(tr));
    tr.tx_buf = reinterpret_cast<uintptr_t>(data);
    tr.len = static_cast<uint32_t>(len);
    tr.speed_hz = hz_;
    tr.bits_per_word = 8;
    if (ioctl(fd_, SPI_IOC_MESSAGE(1), &tr) < 0) {
        spdlog::error("[SpiBus] transfer of {} bytes failed: {}", len, std::strerror(errno));
        return false;
    }
    return true;
}

uint32_t SpiBus::set_frequency(uint32_t hz) {
    if (fd_ < 0) return 0;
    uint32_t actual = hz;
    if (ioctl(fd_, SPI_IOC_WR_MAX_SPEED_HZ, &hz) < 0 || ioctl(fd_, SPI_IOC_RD_MAX_SPEED_HZ, &actual) < 0) {
        spdlog::error("[SpiBus] cannot set clock to {} Hz: {}", hz, std::strerror(errno));
        return 0;
    }
    hz_ = actual;
    return hz_;
}

} // namespace ashface
