#pragma once

#include <memory>
#include <string>
#include <vector>
#include "hardware.hpp"

// One write seen by the simulated backend.
struct SimEvent {
    enum class Kind { Claim, Write, Show } kind;
    std::string label;
    bool on = false;          // Write
    std::vector<Rgb> frame;   // Show
};

// Shared between the backend and the outputs it hands out, so tests can
// inspect writes after the drivers are gone.
struct SimRecord {
    std::vector<SimEvent> events;

    // Writes to one label, in order.
    std::vector<bool> writes_to(const std::string& label) const;
    // Last level written to a label, false if never written.
    bool level(const std::string& label) const;
    // Frame passed to the most recent show(), empty if none.
    std::vector<Rgb> last_frame() const;
    int show_count() const;
};

// No I/O at all: every claim and write is recorded and logged at debug.
class SimulatedBackend : public HardwareBackend {
public:
    SimulatedBackend();
    explicit SimulatedBackend(std::shared_ptr<SimRecord> record);

    std::unique_ptr<DigitalOutput> claim_output(const std::string& label,
                                                unsigned pin) override;
    std::unique_ptr<PixelStrip> open_pixels(const MatrixConfig& matrix) override;
    const char* name() const override { return "simulated"; }

    const std::shared_ptr<SimRecord>& record() const { return record_; }

private:
    std::shared_ptr<SimRecord> record_;
};
