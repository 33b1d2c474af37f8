#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>

// Command-line settings, unset unless given. Applied last, over the role
// defaults and the YAML file.
struct CliOverrides {
    std::optional<std::string> config_path;

    std::optional<std::string> container;
    std::optional<std::string> docker_cmd;
    std::optional<std::string> slurm_user;
    std::optional<std::string> quantum_partition;
    std::optional<long> interval;
    bool verbose = false;
    std::optional<std::string> log_file;
    bool no_matrix = false;
    std::optional<double> brightness;
    std::optional<long> normal_pin;
    std::optional<long> quantum_pin;
    bool simulate = false;
    bool self_test = false;
    bool once = false;

    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<std::string> target_container;
    std::vector<std::string> keys;

    bool help = false;
};

// Parse the arguments that follow the role word.
Result<CliOverrides> parse_cli_args(const std::vector<std::string>& args);

// Role defaults, then the YAML file (if any), then the command line, then
// validation.
Result<MonitorConfig> build_config(MonitorRole role, const CliOverrides& cli);

// Option reference printed by --help.
std::string options_help();
