#include "failure_throttle.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::Spawn:      return "spawn";
        case FailureKind::Timeout:    return "timeout";
        case FailureKind::Connect:    return "connect";
        case FailureKind::Auth:       return "auth";
        case FailureKind::Channel:    return "channel";
        case FailureKind::ExitStatus: return "exit-status";
        case FailureKind::Malformed:  return "malformed";
    }
    return "unknown";
}

FailureKind classify_failure(const CommandResult& result) {
    switch (result.status) {
        case CommandStatus::SpawnFailed:   return FailureKind::Spawn;
        case CommandStatus::TimedOut:      return FailureKind::Timeout;
        case CommandStatus::ConnectFailed: return FailureKind::Connect;
        case CommandStatus::AuthFailed:    return FailureKind::Auth;
        case CommandStatus::ChannelFailed: return FailureKind::Channel;
        case CommandStatus::Completed:     break;
    }
    return FailureKind::ExitStatus;
}

FailureThrottle::FailureThrottle(std::string source)
    : source_(std::move(source)) {}

bool FailureThrottle::record_failure(FailureKind kind, const std::string& detail) {
    ++consecutive_;

    if (!last_kind_ || *last_kind_ != kind) {
        last_kind_ = kind;
        repeats_ = 1;
        log_warn(fmt::format("{}: query failed ({}): {}", source_,
                             failure_kind_name(kind), detail));
        return true;
    }

    ++repeats_;
    if (repeats_ % FAILURE_LOG_REPEAT_EVERY == 0) {
        log_warn(fmt::format("{}: query still failing ({}, {} times in a row): {}",
                             source_, failure_kind_name(kind), repeats_, detail));
        return true;
    }
    log_debug(fmt::format("{}: query failed ({}): {}", source_,
                          failure_kind_name(kind), detail));
    return false;
}

bool FailureThrottle::record_success() {
    if (consecutive_ == 0) return false;
    log_info(fmt::format("{}: query recovered after {} failed attempt{}", source_,
                         consecutive_, consecutive_ == 1 ? "" : "s"));
    consecutive_ = 0;
    repeats_ = 0;
    last_kind_.reset();
    return true;
}
