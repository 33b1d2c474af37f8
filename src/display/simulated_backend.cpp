#include "simulated_backend.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

namespace {

class SimOutput : public DigitalOutput {
public:
    SimOutput(std::string label, unsigned pin, std::shared_ptr<SimRecord> record)
        : label_(std::move(label)), pin_(pin), record_(std::move(record)) {}

    void write(bool on) override {
        record_->events.push_back({SimEvent::Kind::Write, label_, on, {}});
        log_debug(fmt::format("[SIM] {} (GPIO {}): {}", label_, pin_, on ? "ON" : "OFF"));
    }

    const std::string& label() const override { return label_; }

private:
    std::string label_;
    unsigned pin_;
    std::shared_ptr<SimRecord> record_;
};

class SimPixels : public PixelStrip {
public:
    SimPixels(int count, std::shared_ptr<SimRecord> record)
        : pixels_(static_cast<size_t>(count)), record_(std::move(record)) {}

    int size() const override { return static_cast<int>(pixels_.size()); }

    void set(int index, Rgb color) override {
        if (index >= 0 && index < size()) pixels_[static_cast<size_t>(index)] = color;
    }

    void fill(Rgb color) override {
        for (auto& p : pixels_) p = color;
    }

    void show() override {
        int lit = 0;
        for (const auto& p : pixels_) if (p != Rgb{}) ++lit;
        record_->events.push_back({SimEvent::Kind::Show, "matrix", false, pixels_});
        log_debug(fmt::format("[SIM] matrix: show ({} of {} pixels lit)", lit, size()));
    }

private:
    std::vector<Rgb> pixels_;
    std::shared_ptr<SimRecord> record_;
};

} // namespace

// ── SimRecord ───────────────────────────────────────────────

std::vector<bool> SimRecord::writes_to(const std::string& label) const {
    std::vector<bool> out;
    for (const auto& e : events) {
        if (e.kind == SimEvent::Kind::Write && e.label == label) out.push_back(e.on);
    }
    return out;
}

bool SimRecord::level(const std::string& label) const {
    auto w = writes_to(label);
    return !w.empty() && w.back();
}

std::vector<Rgb> SimRecord::last_frame() const {
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if (it->kind == SimEvent::Kind::Show) return it->frame;
    }
    return {};
}

int SimRecord::show_count() const {
    int n = 0;
    for (const auto& e : events) if (e.kind == SimEvent::Kind::Show) ++n;
    return n;
}

// ── SimulatedBackend ────────────────────────────────────────

SimulatedBackend::SimulatedBackend()
    : record_(std::make_shared<SimRecord>()) {}

SimulatedBackend::SimulatedBackend(std::shared_ptr<SimRecord> record)
    : record_(std::move(record)) {}

std::unique_ptr<DigitalOutput> SimulatedBackend::claim_output(const std::string& label,
                                                              unsigned pin) {
    record_->events.push_back({SimEvent::Kind::Claim, label, false, {}});
    log_debug(fmt::format("[SIM] claimed {} on GPIO {}", label, pin));
    return std::make_unique<SimOutput>(label, pin, record_);
}

std::unique_ptr<PixelStrip> SimulatedBackend::open_pixels(const MatrixConfig& matrix) {
    record_->events.push_back({SimEvent::Kind::Claim, "matrix", false, {}});
    log_debug(fmt::format("[SIM] opened {}x{} matrix", matrix.width, matrix.height));
    return std::make_unique<SimPixels>(matrix.width * matrix.height, record_);
}
