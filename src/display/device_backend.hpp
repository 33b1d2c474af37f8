#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "hardware.hpp"

// Encode pixels for a WS2812 strip clocked from SPI at 2.4 MHz: each data
// bit becomes three SPI bits (1 -> 110, 0 -> 100), bytes go out in GRB
// order, and a run of zero bytes at the end latches the frame.
std::vector<uint8_t> encode_ws2812_spi(const std::vector<Rgb>& pixels);

// Real outputs on a Linux host:
//   GPIO lines through the GPIO character device (uAPI v2), claimed as
//   outputs, initially low. The kernel refuses a line another process holds.
//   The pixel matrix as a WS2812 strip on spidev, held through a lock file
//   since spidev itself does not arbitrate between processes.
// Every claim failure throws HardwareClaimError.
class DeviceBackend : public HardwareBackend {
public:
    explicit DeviceBackend(std::string gpio_chip);
    ~DeviceBackend() override;

    DeviceBackend(const DeviceBackend&) = delete;
    DeviceBackend& operator=(const DeviceBackend&) = delete;

    std::unique_ptr<DigitalOutput> claim_output(const std::string& label,
                                                unsigned pin) override;
    std::unique_ptr<PixelStrip> open_pixels(const MatrixConfig& matrix) override;
    const char* name() const override { return "device"; }

private:
    int chip_fd();

    std::string gpio_chip_;
    int chip_fd_ = -1;
};
