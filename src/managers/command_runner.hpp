#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/session.hpp>

// Executes one scheduler CLI invocation and reports how it ended.
// Implementations never throw; every failure is folded into CommandResult.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& argv, int timeout_secs) = 0;

    // Short human-readable description for log lines ("local", "rasqberry@host")
    virtual std::string describe() const = 0;
};

// Runs the command as a child process on this host.
class LocalRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, int timeout_secs) override;
    std::string describe() const override { return "local"; }
};

// Runs the command through a fresh, non-interactive SSH exec channel.
class RemoteRunner : public CommandRunner {
public:
    explicit RemoteRunner(SessionTarget target);

    CommandResult run(const std::vector<std::string>& argv, int timeout_secs) override;
    std::string describe() const override;

private:
    SessionTarget target_;
};
