#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <core/config.hpp>
#include <core/types.hpp>

// Raised when an output cannot be claimed: line busy, device missing,
// lock held by another monitor. Fatal at startup (exit code 2).
class HardwareClaimError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One binary output line (an LED on a GPIO pin).
class DigitalOutput {
public:
    virtual ~DigitalOutput() = default;
    virtual void write(bool on) = 0;
    virtual const std::string& label() const = 0;
};

// Indexed RGB pixels; set() only stages, show() latches the whole frame.
class PixelStrip {
public:
    virtual ~PixelStrip() = default;
    virtual int size() const = 0;
    virtual void set(int index, Rgb color) = 0;
    virtual void fill(Rgb color) = 0;
    virtual void show() = 0;
};

// Hands out claimed outputs. Claims last as long as the returned objects.
class HardwareBackend {
public:
    virtual ~HardwareBackend() = default;

    virtual std::unique_ptr<DigitalOutput> claim_output(const std::string& label,
                                                        unsigned pin) = 0;
    virtual std::unique_ptr<PixelStrip> open_pixels(const MatrixConfig& matrix) = 0;

    virtual const char* name() const = 0;
};
