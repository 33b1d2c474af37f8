#include "device_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/singleton.hpp>
#include <fmt/format.h>

#include <linux/gpio.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace {

constexpr const char* GPIO_CONSUMER = "slurmled";

std::string errno_text() {
    return std::strerror(errno);
}

// ── GPIO line ───────────────────────────────────────────────

class GpioOutput : public DigitalOutput {
public:
    GpioOutput(std::string label, unsigned pin, int line_fd)
        : label_(std::move(label)), pin_(pin), fd_(line_fd) {}

    ~GpioOutput() override {
        if (fd_ >= 0) close(fd_);
    }

    void write(bool on) override {
        struct gpio_v2_line_values values;
        std::memset(&values, 0, sizeof(values));
        values.mask = 1;
        values.bits = on ? 1 : 0;
        if (ioctl(fd_, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0) {
            throw std::runtime_error(fmt::format("GPIO {} ({}) write failed: {}",
                                                 pin_, label_, errno_text()));
        }
    }

    const std::string& label() const override { return label_; }

private:
    std::string label_;
    unsigned pin_;
    int fd_;
};

// ── WS2812 over spidev ──────────────────────────────────────

class SpiPixelStrip : public PixelStrip {
public:
    SpiPixelStrip(int fd, int count, std::unique_ptr<SingletonLock> lock)
        : fd_(fd), pixels_(static_cast<size_t>(count)), lock_(std::move(lock)) {}

    ~SpiPixelStrip() override {
        if (fd_ >= 0) close(fd_);
    }

    int size() const override { return static_cast<int>(pixels_.size()); }

    void set(int index, Rgb color) override {
        if (index >= 0 && index < size()) pixels_[static_cast<size_t>(index)] = color;
    }

    void fill(Rgb color) override {
        for (auto& p : pixels_) p = color;
    }

    void show() override {
        auto buf = encode_ws2812_spi(pixels_);

        struct spi_ioc_transfer xfer;
        std::memset(&xfer, 0, sizeof(xfer));
        xfer.tx_buf = reinterpret_cast<uintptr_t>(buf.data());
        xfer.len = static_cast<uint32_t>(buf.size());
        xfer.speed_hz = WS2812_SPI_HZ;
        xfer.bits_per_word = 8;

        if (ioctl(fd_, SPI_IOC_MESSAGE(1), &xfer) < 0) {
            throw std::runtime_error("SPI transfer to matrix failed: " + errno_text());
        }
    }

private:
    int fd_;
    std::vector<Rgb> pixels_;
    std::unique_ptr<SingletonLock> lock_;
};

void append_ws2812_byte(std::vector<uint8_t>& out, uint8_t value) {
    // 8 data bits -> 24 SPI bits
    uint32_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 3) | (((value >> i) & 1) ? 0b110u : 0b100u);
    }
    out.push_back(static_cast<uint8_t>(bits >> 16));
    out.push_back(static_cast<uint8_t>(bits >> 8));
    out.push_back(static_cast<uint8_t>(bits));
}

} // namespace

std::vector<uint8_t> encode_ws2812_spi(const std::vector<Rgb>& pixels) {
    std::vector<uint8_t> out;
    out.reserve(pixels.size() * 9 + WS2812_RESET_BYTES);
    for (const auto& p : pixels) {
        append_ws2812_byte(out, p.g);
        append_ws2812_byte(out, p.r);
        append_ws2812_byte(out, p.b);
    }
    out.insert(out.end(), static_cast<size_t>(WS2812_RESET_BYTES), uint8_t{0});
    return out;
}

// ── DeviceBackend ───────────────────────────────────────────

DeviceBackend::DeviceBackend(std::string gpio_chip)
    : gpio_chip_(std::move(gpio_chip)) {}

DeviceBackend::~DeviceBackend() {
    if (chip_fd_ >= 0) close(chip_fd_);
}

int DeviceBackend::chip_fd() {
    if (chip_fd_ >= 0) return chip_fd_;
    chip_fd_ = open(gpio_chip_.c_str(), O_RDWR | O_CLOEXEC);
    if (chip_fd_ < 0) {
        throw HardwareClaimError(fmt::format("cannot open GPIO chip {}: {}",
                                             gpio_chip_, errno_text()));
    }
    return chip_fd_;
}

std::unique_ptr<DigitalOutput> DeviceBackend::claim_output(const std::string& label,
                                                           unsigned pin) {
    struct gpio_v2_line_request req;
    std::memset(&req, 0, sizeof(req));
    req.offsets[0] = pin;
    req.num_lines = 1;
    std::strncpy(req.consumer, GPIO_CONSUMER, sizeof(req.consumer) - 1);
    req.config.flags = GPIO_V2_LINE_FLAG_OUTPUT;
    req.config.num_attrs = 1;
    req.config.attrs[0].attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
    req.config.attrs[0].attr.values = 0;   // start low
    req.config.attrs[0].mask = 1;

    if (ioctl(chip_fd(), GPIO_V2_GET_LINE_IOCTL, &req) < 0) {
        if (errno == EBUSY) {
            throw HardwareClaimError(fmt::format(
                "GPIO {} ({}) is already in use by another process", pin, label));
        }
        throw HardwareClaimError(fmt::format("cannot claim GPIO {} ({}) on {}: {}",
                                             pin, label, gpio_chip_, errno_text()));
    }

    log_debug(fmt::format("claimed GPIO {} for {}", pin, label));
    return std::make_unique<GpioOutput>(label, pin, req.fd);
}

std::unique_ptr<PixelStrip> DeviceBackend::open_pixels(const MatrixConfig& matrix) {
    auto lock = std::make_unique<SingletonLock>(matrix.lock_path);
    if (lock->contended()) {
        throw HardwareClaimError(fmt::format(
            "pixel matrix is held by another process (lock {})", matrix.lock_path));
    }
    if (!lock->held()) {
        throw HardwareClaimError(fmt::format("cannot open matrix lock {}: {}",
                                             matrix.lock_path, std::strerror(lock->error())));
    }

    int fd = open(matrix.device.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        throw HardwareClaimError(fmt::format("cannot open matrix device {}: {}",
                                             matrix.device, errno_text()));
    }

    uint8_t mode = SPI_MODE_0;
    uint8_t bits = 8;
    uint32_t speed = WS2812_SPI_HZ;
    if (ioctl(fd, SPI_IOC_WR_MODE, &mode) < 0 ||
        ioctl(fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
        ioctl(fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed) < 0) {
        std::string err = errno_text();
        close(fd);
        throw HardwareClaimError(fmt::format("cannot configure SPI on {}: {}",
                                             matrix.device, err));
    }

    log_debug(fmt::format("opened {}x{} matrix on {}", matrix.width, matrix.height,
                          matrix.device));
    return std::make_unique<SpiPixelStrip>(fd, matrix.width * matrix.height,
                                           std::move(lock));
}
