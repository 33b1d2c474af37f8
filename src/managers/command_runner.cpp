#include "command_runner.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>

CommandResult LocalRunner::run(const std::vector<std::string>& argv, int timeout_secs) {
    auto result = platform::run_capture(argv, timeout_secs * 1000);
    log_command("local", join_command(argv), result.exit_code,
                result.stdout_data, result.stderr_data);
    return result;
}

RemoteRunner::RemoteRunner(SessionTarget target)
    : target_(std::move(target)) {}

CommandResult RemoteRunner::run(const std::vector<std::string>& argv, int timeout_secs) {
    std::string cmd = join_command(argv);
    SessionManager session(target_);
    auto result = session.exec(cmd, timeout_secs);
    log_command(describe(), cmd, result.exit_code, result.stdout_data, result.stderr_data);
    return result;
}

std::string RemoteRunner::describe() const {
    return target_.user + "@" + target_.host;
}
