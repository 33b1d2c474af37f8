#include "state_source.hpp"
#include "slurm_helpers.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// First non-empty stderr line, or a stand-in when the command said nothing.
std::string failure_detail(const CommandResult& r) {
    std::string msg = r.stderr_data;
    auto nl = msg.find('\n');
    if (nl != std::string::npos) msg.erase(nl);
    trim(msg);
    if (r.status == CommandStatus::Completed) {
        return msg.empty() ? fmt::format("exit code {}", r.exit_code)
                           : fmt::format("exit code {}: {}", r.exit_code, msg);
    }
    return msg.empty() ? "no detail" : msg;
}

} // namespace

StateSource::StateSource(const MonitorConfig& config,
                         std::unique_ptr<CommandRunner> job_runner,
                         std::unique_ptr<CommandRunner> node_runner)
    : jobs_cfg_(config.jobs),
      remote_cfg_(config.remote),
      job_runner_(std::move(job_runner)),
      node_runner_(std::move(node_runner)),
      job_throttle_("squeue"),
      node_throttle_("sinfo") {}

Result<std::vector<Job>> StateSource::query_jobs() {
    using R = Result<std::vector<Job>>;
    if (!job_runner_) return R::Err("job query disabled");

    auto result = job_runner_->run(build_squeue_command(jobs_cfg_), jobs_cfg_.timeout);
    if (result.failed()) {
        std::string detail = failure_detail(result);
        job_throttle_.record_failure(classify_failure(result), detail);
        return R::Err(detail);
    }

    auto parsed = parse_job_rows(result.stdout_data);
    if (parsed.is_err()) {
        job_throttle_.record_failure(FailureKind::Malformed, parsed.error);
        return R::Err(parsed.error);
    }

    job_throttle_.record_success();
    log_debug(fmt::format("squeue: {} running job{}", parsed.value.size(),
                          parsed.value.size() == 1 ? "" : "s"));
    return parsed;
}

Result<std::vector<NodeState>> StateSource::query_nodes() {
    using R = Result<std::vector<NodeState>>;
    if (!node_runner_) return R::Err("node query disabled");

    auto result = node_runner_->run(build_sinfo_command(remote_cfg_), remote_cfg_.timeout);
    if (result.failed()) {
        std::string detail = fmt::format("{}: {}", node_runner_->describe(),
                                         failure_detail(result));
        node_throttle_.record_failure(classify_failure(result), detail);
        return R::Err(detail);
    }

    auto parsed = parse_node_rows(result.stdout_data);
    if (parsed.is_err()) {
        node_throttle_.record_failure(FailureKind::Malformed, parsed.error);
        return R::Err(parsed.error);
    }

    node_throttle_.record_success();
    if (log_level() == LogLevel::Debug) {
        std::string summary;
        for (const auto& n : parsed.value) {
            if (!summary.empty()) summary += " ";
            summary += n.node_id + "=" + node_token_name(n.token);
        }
        log_debug("sinfo: " + (summary.empty() ? std::string("(empty)") : summary));
    }
    return parsed;
}

std::unique_ptr<CommandRunner> make_job_runner(const MonitorConfig& config) {
    if (!config.jobs.enabled) return nullptr;
    return std::make_unique<LocalRunner>();
}

std::unique_ptr<CommandRunner> make_node_runner(const MonitorConfig& config) {
    if (!config.remote.enabled) return nullptr;
    SessionTarget target;
    target.host = config.remote.host;
    target.user = config.remote.user;
    target.port = SSH_PORT;
    target.connect_timeout = config.remote.connect_timeout;
    target.key_paths = config.remote.key_paths;
    return std::make_unique<RemoteRunner>(std::move(target));
}
