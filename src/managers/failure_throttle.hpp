#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// Classes of transient query failure. A change of class is always logged.
enum class FailureKind {
    Spawn,
    Timeout,
    Connect,
    Auth,
    Channel,
    ExitStatus,
    Malformed,
};

const char* failure_kind_name(FailureKind kind);

// Map how a command ended onto a failure class. Only meaningful for results
// that did not succeed; a completed command with a non-zero code is ExitStatus.
FailureKind classify_failure(const CommandResult& result);

// Rate-limits failure log lines for one query so a down controller does not
// flood the log every few seconds.
class FailureThrottle {
public:
    explicit FailureThrottle(std::string source);

    // Returns true when the failure was written to the log.
    bool record_failure(FailureKind kind, const std::string& detail);

    // Returns true when a recovery line was written.
    bool record_success();

    int consecutive_failures() const { return consecutive_; }

private:
    std::string source_;
    std::optional<FailureKind> last_kind_;
    int repeats_ = 0;       // consecutive failures of last_kind_
    int consecutive_ = 0;   // consecutive failures of any kind
};
