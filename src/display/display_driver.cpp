#include "display_driver.hpp"
#include "device_backend.hpp"
#include "simulated_backend.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

DisplayDriver::DisplayDriver(std::unique_ptr<HardwareBackend> backend,
                             const MonitorConfig& config)
    : backend_(std::move(backend)) {
    if (config.indicators.enabled) {
        indicators_ = std::make_unique<IndicatorDriver>(*backend_, config.indicators);
    }
    if (config.matrix.enabled) {
        matrix_ = std::make_unique<MatrixDriver>(backend_->open_pixels(config.matrix),
                                                 config.matrix);
    }
    if (config.panel.enabled) {
        panel_ = std::make_unique<NodePanelDriver>(*backend_, config.panel);
    }
    log_debug(fmt::format("display: {} backend, indicators {}, matrix {}, node panel {}",
                          backend_->name(),
                          indicators_ ? "on" : "off",
                          matrix_ ? "on" : "off",
                          panel_ ? "on" : "off"));
}

// Outputs release their claims in reverse order of acquisition
DisplayDriver::~DisplayDriver() {
    panel_.reset();
    matrix_.reset();
    indicators_.reset();
}

bool DisplayDriver::apply(const DisplayDirectives& d) {
    bool ok = true;
    if (indicators_) {
        try {
            indicators_->apply(d.indicator_a, d.indicator_b);
        } catch (const std::exception& e) {
            log_error(fmt::format("indicator update failed: {}", e.what()));
            ok = false;
        }
    }
    if (matrix_) {
        try {
            matrix_->apply(d.matrix_text);
        } catch (const std::exception& e) {
            log_error(fmt::format("matrix update failed: {}", e.what()));
            ok = false;
        }
    }
    if (panel_) {
        try {
            panel_->apply(d.node_lights);
        } catch (const std::exception& e) {
            log_error(fmt::format("node panel update failed: {}", e.what()));
            ok = false;
        }
    }
    return ok;
}

void DisplayDriver::self_test() {
    if (!panel_) {
        throw std::logic_error("self-test requires the node panel");
    }
    panel_->self_test();
}

void DisplayDriver::shutdown() {
    if (indicators_) indicators_->shutdown();
    if (matrix_) {
        try {
            matrix_->shutdown();
        } catch (const std::exception& e) {
            log_warn(fmt::format("could not blank matrix: {}", e.what()));
        }
    }
    if (panel_) panel_->shutdown();
}

std::unique_ptr<HardwareBackend> make_backend(const MonitorConfig& config) {
    if (config.simulate) return std::make_unique<SimulatedBackend>();
    return std::make_unique<DeviceBackend>(config.gpio_chip);
}
