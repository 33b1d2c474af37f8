#include "options.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <functional>
#include <limits>
#include <map>

namespace {

using Args = std::vector<std::string>;

struct ValueOption {
    std::vector<const char*> names;
    std::function<Result<void>(CliOverrides&, const std::string&)> apply;
};

Result<void> set_string(std::optional<std::string>& field, const std::string& v) {
    field = v;
    return Result<void>::Ok();
}

Result<void> set_long(std::optional<long>& field, const std::string& opt,
                      const std::string& v) {
    auto n = parse_long(v);
    if (!n) return Result<void>::Err(fmt::format("{} expects an integer, got '{}'", opt, v));
    // Stored into int config fields
    if (*n > std::numeric_limits<int>::max() || *n < std::numeric_limits<int>::min()) {
        return Result<void>::Err(fmt::format("{} is out of range: {}", opt, v));
    }
    field = *n;
    return Result<void>::Ok();
}

Result<void> set_pin(std::optional<long>& field, const std::string& opt,
                     const std::string& v) {
    auto r = set_long(field, opt, v);
    if (r.is_ok() && *field < 0) {
        return Result<void>::Err(fmt::format("{} must not be negative", opt));
    }
    return r;
}

const std::vector<ValueOption>& value_options() {
    static const std::vector<ValueOption> opts = {
        {{"-c", "--container"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.container, v); }},
        {{"--docker-cmd"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.docker_cmd, v); }},
        {{"-s", "--slurm-user"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.slurm_user, v); }},
        {{"-q", "--quantum-partition"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.quantum_partition, v); }},
        {{"-i", "--interval"},
         [](CliOverrides& o, const std::string& v) { return set_long(o.interval, "--interval", v); }},
        {{"--log-file"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.log_file, v); }},
        {{"--matrix-brightness"},
         [](CliOverrides& o, const std::string& v) -> Result<void> {
             auto d = parse_double(v);
             if (!d) {
                 return Result<void>::Err(
                     fmt::format("--matrix-brightness expects a number, got '{}'", v));
             }
             o.brightness = *d;
             return Result<void>::Ok();
         }},
        {{"--normal-pin"},
         [](CliOverrides& o, const std::string& v) { return set_pin(o.normal_pin, "--normal-pin", v); }},
        {{"--quantum-pin"},
         [](CliOverrides& o, const std::string& v) { return set_pin(o.quantum_pin, "--quantum-pin", v); }},
        {{"--host"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.host, v); }},
        {{"-u", "--user"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.user, v); }},
        {{"--target-container"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.target_container, v); }},
        {{"--key"},
         [](CliOverrides& o, const std::string& v) {
             o.keys.push_back(v);
             return Result<void>::Ok();
         }},
        {{"--config"},
         [](CliOverrides& o, const std::string& v) { return set_string(o.config_path, v); }},
    };
    return opts;
}

const std::map<std::string, bool CliOverrides::*>& flag_options() {
    static const std::map<std::string, bool CliOverrides::*> flags = {
        {"-v", &CliOverrides::verbose},
        {"--verbose", &CliOverrides::verbose},
        {"--no-matrix", &CliOverrides::no_matrix},
        {"--simulate", &CliOverrides::simulate},
        {"-t", &CliOverrides::self_test},
        {"--test", &CliOverrides::self_test},
        {"--once", &CliOverrides::once},
        {"-h", &CliOverrides::help},
        {"--help", &CliOverrides::help},
    };
    return flags;
}

const ValueOption* find_value_option(const std::string& name) {
    for (const auto& opt : value_options()) {
        for (const char* n : opt.names) {
            if (name == n) return &opt;
        }
    }
    return nullptr;
}

} // namespace

Result<CliOverrides> parse_cli_args(const Args& args) {
    using R = Result<CliOverrides>;
    CliOverrides o;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::string value;
        bool has_inline_value = false;

        // --name=value
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        auto flag = flag_options().find(arg);
        if (flag != flag_options().end()) {
            if (has_inline_value) return R::Err(fmt::format("{} takes no value", arg));
            o.*(flag->second) = true;
            continue;
        }

        const ValueOption* opt = find_value_option(arg);
        if (!opt) return R::Err(fmt::format("unknown option '{}'", args[i]));

        if (!has_inline_value) {
            if (i + 1 >= args.size()) return R::Err(fmt::format("{} needs a value", arg));
            value = args[++i];
        }
        auto r = opt->apply(o, value);
        if (r.is_err()) return R::Err(r.error);
    }
    return R::Ok(std::move(o));
}

static void apply_overrides(MonitorConfig& c, const CliOverrides& o) {
    if (o.container) c.jobs.container = *o.container;
    if (o.docker_cmd) {
        c.jobs.docker_cmd = *o.docker_cmd;
        c.remote.docker_cmd = *o.docker_cmd;
    }
    if (o.slurm_user) {
        if (o.slurm_user->empty()) c.jobs.slurm_user.reset();
        else c.jobs.slurm_user = *o.slurm_user;
    }
    if (o.quantum_partition) c.quantum_partition = *o.quantum_partition;
    if (o.interval) c.interval_secs = static_cast<int>(*o.interval);
    if (o.verbose) c.verbose = true;
    if (o.log_file) c.log_file = *o.log_file;
    if (o.no_matrix) c.matrix.enabled = false;
    if (o.brightness) c.matrix.brightness = *o.brightness;
    if (o.normal_pin) c.indicators.normal_pin = static_cast<unsigned>(*o.normal_pin);
    if (o.quantum_pin) c.indicators.quantum_pin = static_cast<unsigned>(*o.quantum_pin);
    if (o.simulate) c.simulate = true;
    if (o.self_test) c.self_test = true;
    if (o.once) c.once = true;

    if (o.host) c.remote.host = *o.host;
    if (o.user) c.remote.user = *o.user;
    if (o.target_container) c.remote.container = *o.target_container;
    if (!o.keys.empty()) {
        // Keys given on the command line are tried first
        std::vector<std::string> keys = o.keys;
        keys.insert(keys.end(), c.remote.key_paths.begin(), c.remote.key_paths.end());
        c.remote.key_paths = std::move(keys);
    }
}

Result<MonitorConfig> build_config(MonitorRole role, const CliOverrides& cli) {
    using R = Result<MonitorConfig>;
    MonitorConfig config = default_config(role);

    if (cli.config_path) {
        auto r = overlay_config_file(config, expand_home(*cli.config_path));
        if (r.is_err()) return R::Err(r.error);
    }

    apply_overrides(config, cli);

    auto v = validate_config(config);
    if (v.is_err()) return R::Err(v.error);
    return R::Ok(std::move(config));
}

std::string options_help() {
    return
        "  -c, --container NAME          container that runs squeue (default: login)\n"
        "      --docker-cmd CMD          container runtime (default: docker)\n"
        "  -s, --slurm-user USER         only count this user's jobs\n"
        "  -q, --quantum-partition NAME  quantum partition (default: quantum)\n"
        "  -i, --interval SECS           poll interval (jobs: 30, nodes: 5)\n"
        "  -v, --verbose                 debug logging\n"
        "      --log-file PATH           also append log lines to PATH\n"
        "      --no-matrix               disable the pixel matrix\n"
        "      --matrix-brightness F     matrix brightness 0.0-1.0 (default: 0.5)\n"
        "      --normal-pin N            classical indicator GPIO (default: 17)\n"
        "      --quantum-pin N           quantum indicator GPIO (default: 27)\n"
        "      --simulate                log output changes instead of driving hardware\n"
        "  -t, --test                    node panel self-test, then exit\n"
        "      --once                    run a single poll, then exit\n"
        "      --host HOST               controller host for sinfo (default: 192.168.4.160)\n"
        "  -u, --user USER               SSH user on the controller (default: rasqberry)\n"
        "      --target-container NAME   container that runs sinfo (default: login)\n"
        "      --key PATH                extra private key to try (repeatable)\n"
        "      --config PATH             YAML config file\n";
}
