#include "indicator_driver.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

IndicatorDriver::IndicatorDriver(HardwareBackend& backend, const IndicatorConfig& config) {
    normal_.out = backend.claim_output("normal LED", config.normal_pin);
    quantum_.out = backend.claim_output("quantum LED", config.quantum_pin);
}

bool IndicatorDriver::set(Line& line, bool on) {
    if (line.level && *line.level == on) return false;
    line.out->write(on);
    line.level = on;
    return true;
}

void IndicatorDriver::apply(bool normal_on, bool quantum_on) {
    bool changed = set(normal_, normal_on);
    changed = set(quantum_, quantum_on) || changed;
    if (changed) {
        log_info(fmt::format("Indicators: normal {}, quantum {}",
                             normal_on ? "ON" : "OFF", quantum_on ? "ON" : "OFF"));
    }
}

void IndicatorDriver::shutdown() {
    for (Line* line : {&normal_, &quantum_}) {
        try {
            line->out->write(false);
            line->level = false;
        } catch (const std::exception& e) {
            line->level.reset();
            log_warn(fmt::format("could not turn off {}: {}", line->out->label(), e.what()));
        }
    }
}
