#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <core/config.hpp>
#include <core/types.hpp>
#include <display/display_driver.hpp>
#include "last_known_good.hpp"
#include "state_source.hpp"

enum class LoopState {
    Idle,
    Polling,
    Rendering,
    ShuttingDown,
    Stopped,
};

const char* loop_state_name(LoopState state);

// Single-threaded scheduling harness: poll, resolve against LastKnownGood,
// map, render, commit. Ticks never overlap; the stop flag is checked
// between stages and every 100ms while sleeping.
class PollLoop {
public:
    PollLoop(StateSource& source, DisplayDriver& display, LastKnownGood& lkg,
             const MonitorConfig& config, const std::atomic<bool>& stop);
    ~PollLoop();

    PollLoop(const PollLoop&) = delete;
    PollLoop& operator=(const PollLoop&) = delete;

    // One full tick. Returns false if a stop request abandoned it before
    // rendering; nothing is rendered or committed in that case.
    bool tick();

    // Tick until stopped (or once, with --once), then shut down.
    void run();

    // Drive every output off. Safe to call more than once.
    void shutdown();

    LoopState state() const { return state_; }
    int ticks_completed() const { return ticks_; }

private:
    using Clock = std::chrono::steady_clock;

    // Sleep in slices until deadline. Returns false if stop was requested.
    bool sleep_until(Clock::time_point deadline);

    void log_snapshot(const CanonicalSnapshot& snap);

    StateSource& source_;
    DisplayDriver& display_;
    LastKnownGood& lkg_;
    std::string quantum_partition_;
    std::chrono::seconds interval_;
    bool once_;
    const std::atomic<bool>& stop_;

    LoopState state_ = LoopState::Idle;
    int ticks_ = 0;
    std::optional<CanonicalSnapshot> last_snapshot_;
};
