#include "node_panel_driver.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

NodePanelDriver::NodePanelDriver(HardwareBackend& backend, const NodePanelConfig& config)
    : step_ms_(config.self_test_step_ms) {
    for (const auto& n : config.nodes) {
        Light light;
        light.node_id = n.node_id;
        light.out = backend.claim_output("node " + n.node_id, n.pin);
        lights_.push_back(std::move(light));
    }
}

void NodePanelDriver::apply(const std::map<std::string, bool>& lights) {
    std::string changes;
    for (auto& light : lights_) {
        auto it = lights.find(light.node_id);
        bool on = it != lights.end() && it->second;
        if (light.level && *light.level == on) continue;

        light.out->write(on);
        light.level = on;
        std::string id = light.node_id;
        std::transform(id.begin(), id.end(), id.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        changes += fmt::format(" {}({})", id, on ? "ON" : "OFF");
    }
    if (!changes.empty()) log_info("Nodes:" + changes);
}

void NodePanelDriver::self_test() {
    log_info(fmt::format("Self-test: {} node LEDs, {}ms per step", lights_.size(), step_ms_));

    for (auto& light : lights_) {
        light.out->write(true);
        light.level = true;
        log_info(fmt::format("  {} ON", light.node_id));
        if (step_ms_ > 0) platform::sleep_ms(step_ms_);
    }
    for (auto it = lights_.rbegin(); it != lights_.rend(); ++it) {
        it->out->write(false);
        it->level = false;
        log_info(fmt::format("  {} OFF", it->node_id));
        if (step_ms_ > 0) platform::sleep_ms(step_ms_);
    }

    log_info("Self-test complete");
}

void NodePanelDriver::shutdown() {
    for (auto& light : lights_) {
        try {
            light.out->write(false);
            light.level = false;
        } catch (const std::exception& e) {
            light.level.reset();
            log_warn(fmt::format("could not turn off {}: {}", light.out->label(), e.what()));
        }
    }
}
