#pragma once

#include <memory>
#include "hardware.hpp"
#include "indicator_driver.hpp"
#include "matrix_driver.hpp"
#include "node_panel_driver.hpp"

// Renders directives onto whichever outputs the config enables. Outputs
// are claimed in the constructor, which throws HardwareClaimError if any
// claim fails; a disabled output is never opened.
class DisplayDriver {
public:
    DisplayDriver(std::unique_ptr<HardwareBackend> backend, const MonitorConfig& config);
    ~DisplayDriver();

    DisplayDriver(const DisplayDriver&) = delete;
    DisplayDriver& operator=(const DisplayDriver&) = delete;

    // Idempotent. A failing output is logged and skipped so the others and
    // the next tick still run. Returns false if any output failed.
    bool apply(const DisplayDirectives& directives);

    // Node-panel lamp test. Requires the panel.
    void self_test();

    // Every owned output off, whatever was last written.
    void shutdown();

    bool has_panel() const { return panel_ != nullptr; }
    const char* backend_name() const { return backend_->name(); }

private:
    std::unique_ptr<HardwareBackend> backend_;
    std::unique_ptr<IndicatorDriver> indicators_;
    std::unique_ptr<MatrixDriver> matrix_;
    std::unique_ptr<NodePanelDriver> panel_;
};

// Simulated backend under --simulate, the Linux devices otherwise.
std::unique_ptr<HardwareBackend> make_backend(const MonitorConfig& config);
