#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <display/hardware.hpp>
#include <managers/command_runner.hpp>

// One monitor process: claims its outputs, then runs the poll loop (or the
// self-test) until stopped. Returns a process exit code.
class SlurmledApp {
public:
    explicit SlurmledApp(MonitorConfig config);

    // Replace the default collaborators. Unset ones are built from the config.
    void set_job_runner(std::unique_ptr<CommandRunner> runner);
    void set_node_runner(std::unique_ptr<CommandRunner> runner);
    void set_backend(std::unique_ptr<HardwareBackend> backend);

    int run(const std::atomic<bool>& stop);

    const MonitorConfig& config() const { return config_; }

private:
    MonitorConfig config_;
    std::unique_ptr<CommandRunner> job_runner_;
    std::unique_ptr<CommandRunner> node_runner_;
    std::unique_ptr<HardwareBackend> backend_;
};

// `slurmled <jobs|nodes> [options]`: parse, configure logging, install
// signal handlers, run. args excludes the role word.
int run_monitor(MonitorRole role, const std::vector<std::string>& args);

void print_usage();
