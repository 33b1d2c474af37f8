#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <display/hardware.hpp>
#include <display/simulated_backend.hpp>
#include <managers/command_runner.hpp>

// What a FakeRunner hands out, shared with the test after the runner has
// been moved into a StateSource.
struct RunnerScript {
    std::vector<std::vector<std::string>> calls;
    std::deque<CommandResult> script;
    CommandResult fallback{0, "", "", CommandStatus::Completed};
    std::function<void()> on_run;
};

// Scripted CommandRunner: hands out queued results in order, then repeats
// the last one. Every argv it sees is kept.
class FakeRunner : public CommandRunner {
public:
    using Shared = RunnerScript;

    explicit FakeRunner(std::shared_ptr<Shared> shared = std::make_shared<Shared>())
        : shared_(std::move(shared)) {}

    CommandResult run(const std::vector<std::string>& argv, int) override {
        shared_->calls.push_back(argv);
        if (shared_->on_run) shared_->on_run();
        if (shared_->script.empty()) return shared_->fallback;
        auto r = shared_->script.front();
        shared_->script.pop_front();
        shared_->fallback = r;
        return r;
    }

    std::string describe() const override { return "fake"; }

    static CommandResult ok(const std::string& out) {
        return CommandResult{0, out, "", CommandStatus::Completed};
    }
    static CommandResult exit_code(int code, const std::string& err = "") {
        return CommandResult{code, "", err, CommandStatus::Completed};
    }
    static CommandResult status(CommandStatus s, const std::string& err = "") {
        return CommandResult{-1, "", err, s};
    }

private:
    std::shared_ptr<Shared> shared_;
};

// Backend whose outputs fail: claims (HardwareClaimError) or writes.
class FailingBackend : public HardwareBackend {
public:
    explicit FailingBackend(bool fail_claims) : fail_claims_(fail_claims) {}

    std::unique_ptr<DigitalOutput> claim_output(const std::string& label, unsigned pin) override {
        if (fail_claims_) {
            throw HardwareClaimError("GPIO " + std::to_string(pin) + " busy");
        }
        return std::make_unique<BrokenOutput>(label);
    }

    std::unique_ptr<PixelStrip> open_pixels(const MatrixConfig&) override {
        throw HardwareClaimError("matrix busy");
    }

    const char* name() const override { return "failing"; }

private:
    class BrokenOutput : public DigitalOutput {
    public:
        explicit BrokenOutput(std::string label) : label_(std::move(label)) {}
        void write(bool) override { throw std::runtime_error(label_ + " write failed"); }
        const std::string& label() const override { return label_; }
    private:
        std::string label_;
    };

    bool fail_claims_;
};

// Simulated backend where writes to one label throw; every other output is
// recorded as usual.
class OneBrokenLineBackend : public HardwareBackend {
public:
    OneBrokenLineBackend(std::string broken_label, std::shared_ptr<SimRecord> record)
        : broken_label_(std::move(broken_label)), sim_(std::move(record)) {}

    std::unique_ptr<DigitalOutput> claim_output(const std::string& label, unsigned pin) override {
        if (label == broken_label_) return std::make_unique<BrokenOutput>(label);
        return sim_.claim_output(label, pin);
    }

    std::unique_ptr<PixelStrip> open_pixels(const MatrixConfig& matrix) override {
        return sim_.open_pixels(matrix);
    }

    const char* name() const override { return "one broken line"; }

private:
    class BrokenOutput : public DigitalOutput {
    public:
        explicit BrokenOutput(std::string label) : label_(std::move(label)) {}
        void write(bool) override { throw std::runtime_error(label_ + " write failed"); }
        const std::string& label() const override { return label_; }
    private:
        std::string label_;
    };

    std::string broken_label_;
    SimulatedBackend sim_;
};
