#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "command_runner.hpp"
#include "failure_throttle.hpp"

// Obtains raw scheduler facts. Both queries are read-only and bounded in
// time; a failed query returns Err carrying an empty set, never throws.
class StateSource {
public:
    // A null runner disables that query.
    StateSource(const MonitorConfig& config,
                std::unique_ptr<CommandRunner> job_runner,
                std::unique_ptr<CommandRunner> node_runner);

    bool jobs_enabled() const { return job_runner_ != nullptr; }
    bool nodes_enabled() const { return node_runner_ != nullptr; }

    // Running jobs. Ok with an empty list means nothing is running.
    Result<std::vector<Job>> query_jobs();

    // Per-node states from the controller host. Ok may be empty; the caller
    // decides whether an empty listing is informative.
    Result<std::vector<NodeState>> query_nodes();

private:
    JobSourceConfig jobs_cfg_;
    RemoteSourceConfig remote_cfg_;
    std::unique_ptr<CommandRunner> job_runner_;
    std::unique_ptr<CommandRunner> node_runner_;
    FailureThrottle job_throttle_;
    FailureThrottle node_throttle_;
};

// Build the runners a config asks for: local squeue and SSH sinfo.
std::unique_ptr<CommandRunner> make_job_runner(const MonitorConfig& config);
std::unique_ptr<CommandRunner> make_node_runner(const MonitorConfig& config);
