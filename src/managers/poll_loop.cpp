#include "poll_loop.hpp"
#include "display_mapper.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

const char* loop_state_name(LoopState state) {
    switch (state) {
        case LoopState::Idle:         return "idle";
        case LoopState::Polling:      return "polling";
        case LoopState::Rendering:    return "rendering";
        case LoopState::ShuttingDown: return "shutting-down";
        case LoopState::Stopped:      return "stopped";
    }
    return "unknown";
}

PollLoop::PollLoop(StateSource& source, DisplayDriver& display, LastKnownGood& lkg,
                   const MonitorConfig& config, const std::atomic<bool>& stop)
    : source_(source),
      display_(display),
      lkg_(lkg),
      quantum_partition_(config.quantum_partition),
      interval_(config.interval_secs),
      once_(config.once),
      stop_(stop) {}

PollLoop::~PollLoop() {
    shutdown();
}

bool PollLoop::tick() {
    state_ = LoopState::Polling;

    std::optional<Result<std::vector<Job>>> jobs;
    if (source_.jobs_enabled()) jobs = source_.query_jobs();
    if (stop_) {
        log_debug("stop requested while polling; tick abandoned");
        state_ = LoopState::Idle;
        return false;
    }

    std::optional<Result<std::vector<NodeState>>> nodes;
    if (source_.nodes_enabled()) nodes = source_.query_nodes();
    if (stop_) {
        log_debug("stop requested while polling; tick abandoned");
        state_ = LoopState::Idle;
        return false;
    }

    auto resolved = resolve_tick(jobs ? &*jobs : nullptr,
                                 nodes ? &*nodes : nullptr,
                                 quantum_partition_, lkg_);
    if (jobs && jobs->is_err() && lkg_.jobs) {
        log_debug("squeue failed; showing last known job state");
    }
    if (nodes && !resolved.fresh_nodes && !lkg_.nodes.empty()) {
        log_debug("sinfo gave nothing usable; showing last known node state");
    }
    log_snapshot(resolved.snapshot);

    state_ = LoopState::Rendering;
    display_.apply(map_snapshot(resolved.snapshot));

    commit_tick(lkg_, resolved);
    ++ticks_;
    state_ = LoopState::Idle;
    return true;
}

void PollLoop::run() {
    log_info(fmt::format("Polling every {}s{}", interval_.count(),
                         once_ ? " (single tick)" : ""));

    while (!stop_) {
        auto start = Clock::now();
        tick();
        if (once_) break;

        // Next tick at max(now, start + interval)
        if (!sleep_until(start + interval_)) break;
    }

    if (stop_) log_info("Shutdown requested");
    shutdown();
}

bool PollLoop::sleep_until(Clock::time_point deadline) {
    for (;;) {
        if (stop_) return false;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) return true;
        platform::sleep_ms(static_cast<int>(
            remaining < STOP_CHECK_SLICE_MS ? remaining : STOP_CHECK_SLICE_MS));
    }
}

void PollLoop::shutdown() {
    if (state_ == LoopState::ShuttingDown || state_ == LoopState::Stopped) return;
    state_ = LoopState::ShuttingDown;
    display_.shutdown();
    state_ = LoopState::Stopped;
    log_info(fmt::format("Stopped after {} tick{}; outputs off", ticks_, ticks_ == 1 ? "" : "s"));
}

void PollLoop::log_snapshot(const CanonicalSnapshot& snap) {
    if (last_snapshot_ && *last_snapshot_ == snap) return;

    std::string nodes;
    for (const auto& [id, active] : snap.node_active) {
        if (active) nodes += (nodes.empty() ? "" : ",") + id;
    }
    log_info(fmt::format("State: classical {}, quantum {}{}",
                         snap.classical_active ? "running" : "idle",
                         snap.quantum_active ? "running" : "idle",
                         snap.node_active.empty() ? std::string()
                             : fmt::format(", active nodes [{}]", nodes)));
    last_snapshot_ = snap;
}
