#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "hardware.hpp"

// One LED per configured node, driven in configuration order. Nodes missing
// from the directives are driven off.
class NodePanelDriver {
public:
    NodePanelDriver(HardwareBackend& backend, const NodePanelConfig& config);

    void apply(const std::map<std::string, bool>& lights);

    // Each LED on in configuration order, then off in reverse, one write per
    // LED per phase with step_ms between writes. Ends with everything off.
    void self_test();

    void shutdown();

private:
    struct Light {
        std::string node_id;
        std::unique_ptr<DigitalOutput> out;
        std::optional<bool> level;
    };

    std::vector<Light> lights_;
    int step_ms_;
};
