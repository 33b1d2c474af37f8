#pragma once

#include <memory>
#include <optional>
#include "hardware.hpp"

// The two partition indicators. Each level is written only when it changes;
// the first apply always writes.
class IndicatorDriver {
public:
    IndicatorDriver(HardwareBackend& backend, const IndicatorConfig& config);

    void apply(bool normal_on, bool quantum_on);

    // Force both off whatever was last written.
    void shutdown();

private:
    struct Line {
        std::unique_ptr<DigitalOutput> out;
        std::optional<bool> level;
    };

    bool set(Line& line, bool on);

    Line normal_;
    Line quantum_;
};
