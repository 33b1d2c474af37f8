#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <regex>
#include <set>

namespace fs = std::filesystem;

// ── Names ─────────────────────────────────────────────────────

const char* role_name(MonitorRole role) {
    return role == MonitorRole::Jobs ? "jobs" : "nodes";
}

std::optional<MonitorRole> parse_role(const std::string& name) {
    if (name == "jobs") return MonitorRole::Jobs;
    if (name == "nodes") return MonitorRole::Nodes;
    return std::nullopt;
}

const char* layout_name(MatrixLayout layout) {
    switch (layout) {
        case MatrixLayout::Rows:              return "rows";
        case MatrixLayout::Columns:           return "columns";
        case MatrixLayout::SerpentineRows:    return "serpentine_rows";
        case MatrixLayout::SerpentineColumns: return "serpentine_columns";
    }
    return "rows";
}

std::optional<MatrixLayout> parse_layout(const std::string& name) {
    for (auto l : {MatrixLayout::Rows, MatrixLayout::Columns,
                   MatrixLayout::SerpentineRows, MatrixLayout::SerpentineColumns}) {
        if (name == layout_name(l)) return l;
    }
    return std::nullopt;
}

// ── Defaults ──────────────────────────────────────────────────

MonitorConfig default_config(MonitorRole role) {
    MonitorConfig c;
    c.role = role;
    c.quantum_partition = DEFAULT_QUANTUM_PARTITION;
    c.interval_secs = (role == MonitorRole::Jobs) ? JOBS_POLL_INTERVAL_SECS
                                                  : NODES_POLL_INTERVAL_SECS;
    c.gpio_chip = DEFAULT_GPIO_CHIP;

    c.jobs.enabled = (role == MonitorRole::Jobs);
    c.jobs.docker_cmd = DEFAULT_DOCKER_CMD;
    c.jobs.container = DEFAULT_CONTAINER;
    c.jobs.timeout = LOCAL_QUERY_TIMEOUT_SECS;

    c.remote.enabled = (role == MonitorRole::Nodes);
    c.remote.host = DEFAULT_REMOTE_HOST;
    c.remote.user = DEFAULT_REMOTE_USER;
    c.remote.container = DEFAULT_CONTAINER;
    c.remote.docker_cmd = DEFAULT_DOCKER_CMD;
    c.remote.connect_timeout = REMOTE_CONNECT_TIMEOUT_SECS;
    c.remote.timeout = REMOTE_QUERY_TIMEOUT_SECS;
    c.remote.key_paths = {"~/.ssh/id_ed25519", "~/.ssh/id_rsa"};

    c.indicators.enabled = (role == MonitorRole::Jobs);
    c.indicators.normal_pin = DEFAULT_NORMAL_PIN;
    c.indicators.quantum_pin = DEFAULT_QUANTUM_PIN;

    c.matrix.enabled = (role == MonitorRole::Jobs);
    c.matrix.device = DEFAULT_SPI_DEVICE;
    c.matrix.lock_path = DEFAULT_MATRIX_LOCK;
    c.matrix.width = MATRIX_WIDTH;
    c.matrix.height = MATRIX_HEIGHT;
    c.matrix.brightness = DEFAULT_BRIGHTNESS;

    c.panel.enabled = (role == MonitorRole::Nodes);
    c.panel.nodes = {
        // Classical nodes (green)
        {"c1", 17}, {"c2", 27}, {"c3", 22}, {"c4", 23},
        // Quantum nodes (blue)
        {"q1", 24}, {"q2", 25},
    };
    c.panel.self_test_step_ms = SELF_TEST_STEP_MS;

    return c;
}

// ── YAML overlay ──────────────────────────────────────────────

// A present key must convert; YAML::BadConversion surfaces as a parse error.
template <typename T>
static void read_key(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) out = node[key].as<T>();
}

static void overlay_jobs(const YAML::Node& node, JobSourceConfig& j) {
    read_key(node, "enabled", j.enabled);
    read_key(node, "docker", j.docker_cmd);
    read_key(node, "container", j.container);
    read_key(node, "timeout", j.timeout);
    if (node["user"]) {
        // `user:` with no value clears a filter set by an earlier layer
        std::string user = node["user"].IsNull() ? "" : node["user"].as<std::string>();
        if (user.empty()) j.slurm_user.reset();
        else j.slurm_user = user;
    }
}

static void overlay_remote(const YAML::Node& node, RemoteSourceConfig& r) {
    read_key(node, "enabled", r.enabled);
    read_key(node, "host", r.host);
    read_key(node, "user", r.user);
    read_key(node, "container", r.container);
    read_key(node, "docker", r.docker_cmd);
    read_key(node, "connect_timeout", r.connect_timeout);
    read_key(node, "timeout", r.timeout);

    auto keys = node["keys"] ? node["keys"] : node["key"];
    if (keys) {
        if (keys.IsScalar()) {
            r.key_paths = {keys.as<std::string>()};
        } else if (keys.IsSequence()) {
            r.key_paths = keys.as<std::vector<std::string>>();
        }
    }
}

static void overlay_indicators(const YAML::Node& node, IndicatorConfig& i) {
    read_key(node, "enabled", i.enabled);
    read_key(node, "normal_pin", i.normal_pin);
    read_key(node, "quantum_pin", i.quantum_pin);
}

static Result<void> overlay_matrix(const YAML::Node& node, MatrixConfig& m) {
    read_key(node, "enabled", m.enabled);
    read_key(node, "device", m.device);
    read_key(node, "lock", m.lock_path);
    read_key(node, "width", m.width);
    read_key(node, "height", m.height);
    read_key(node, "brightness", m.brightness);

    if (node["layout"]) {
        std::string name = node["layout"].as<std::string>();
        auto layout = parse_layout(name);
        if (!layout) {
            return Result<void>::Err("unknown matrix layout '" + name + "'");
        }
        m.layout = *layout;
    }
    return Result<void>::Ok();
}

// Accepts either a map (`c1: 17`) or a list (`- {id: c1, pin: 17}`).
// Both keep document order, which is also the self-test order. Node ids are
// matched case-insensitively against sinfo, so they are stored lower-case.
static Result<void> overlay_panel(const YAML::Node& node, NodePanelConfig& p) {
    read_key(node, "enabled", p.enabled);
    read_key(node, "self_test_step_ms", p.self_test_step_ms);
    read_key(node, "self_test_on_start", p.self_test_on_start);

    const YAML::Node pins = node["pins"];
    if (!pins) return Result<void>::Ok();

    std::vector<NodePin> nodes;
    if (pins.IsMap()) {
        for (const auto& kv : pins) {
            nodes.push_back({to_lower(kv.first.as<std::string>()), kv.second.as<unsigned>()});
        }
    } else if (pins.IsSequence()) {
        for (const auto& item : pins) {
            if (!item["id"] || !item["pin"]) {
                return Result<void>::Err("node_panel.pins entries need 'id' and 'pin'");
            }
            nodes.push_back({to_lower(item["id"].as<std::string>()), item["pin"].as<unsigned>()});
        }
    } else {
        return Result<void>::Err("node_panel.pins must be a map or a list");
    }
    p.nodes = std::move(nodes);
    return Result<void>::Ok();
}

static Result<void> overlay_root(MonitorConfig& config, const YAML::Node& root) {
    if (!root || root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) return Result<void>::Err("top level must be a mapping");

    read_key(root, "quantum_partition", config.quantum_partition);
    read_key(root, "interval", config.interval_secs);
    read_key(root, "gpio_chip", config.gpio_chip);
    read_key(root, "log_file", config.log_file);
    read_key(root, "simulate", config.simulate);

    if (root["jobs"]) overlay_jobs(root["jobs"], config.jobs);
    if (root["remote"]) overlay_remote(root["remote"], config.remote);
    if (root["indicators"]) overlay_indicators(root["indicators"], config.indicators);
    if (root["matrix"]) {
        auto r = overlay_matrix(root["matrix"], config.matrix);
        if (r.is_err()) return r;
    }
    if (root["node_panel"]) {
        auto r = overlay_panel(root["node_panel"], config.panel);
        if (r.is_err()) return r;
    }
    return Result<void>::Ok();
}

Result<void> overlay_config_file(MonitorConfig& config, const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<void>::Err("config file not found: " + path.string());
    }
    try {
        auto r = overlay_root(config, YAML::LoadFile(path.string()));
        if (r.is_err()) return Result<void>::Err(path.string() + ": " + r.error);
        return r;
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to parse ") + path.string() + ": " + e.what());
    }
}

Result<void> overlay_config_text(MonitorConfig& config, const std::string& yaml) {
    try {
        return overlay_root(config, YAML::Load(yaml));
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

// ── Validation ────────────────────────────────────────────────

static bool valid_name(const std::string& s) {
    static const std::regex re("^[A-Za-z0-9][A-Za-z0-9_.-]*$");
    return std::regex_match(s, re);
}

Result<void> validate_config(const MonitorConfig& c) {
    auto err = [](const std::string& msg) { return Result<void>::Err(msg); };

    if (c.interval_secs <= 0) {
        return err(fmt::format("poll interval must be positive (got {})", c.interval_secs));
    }
    if (c.quantum_partition.empty() || !valid_name(c.quantum_partition)) {
        return err(fmt::format("invalid quantum partition name '{}'", c.quantum_partition));
    }

    bool any_source = c.jobs.enabled || c.remote.enabled;
    bool any_driver = c.indicators.enabled || c.matrix.enabled || c.panel.enabled;
    if (!any_source && !any_driver) {
        return err("nothing to do: every state source and display is disabled");
    }

    if (c.jobs.enabled) {
        if (!c.jobs.container.empty() && !valid_name(c.jobs.container)) {
            return err(fmt::format("invalid container name '{}'", c.jobs.container));
        }
        if (!c.jobs.container.empty() && c.jobs.docker_cmd.empty()) {
            return err("a container runtime command is required with --container");
        }
        if (c.jobs.slurm_user && !valid_name(*c.jobs.slurm_user)) {
            return err(fmt::format("invalid SLURM user name '{}'", *c.jobs.slurm_user));
        }
        if (c.jobs.timeout <= 0) {
            return err("local query timeout must be positive");
        }
    }

    if (c.remote.enabled) {
        if (c.remote.host.empty()) return err("remote host is required for the node query");
        if (c.remote.user.empty() || !valid_name(c.remote.user)) {
            return err(fmt::format("invalid remote user '{}'", c.remote.user));
        }
        if (!c.remote.container.empty() && !valid_name(c.remote.container)) {
            return err(fmt::format("invalid target container name '{}'", c.remote.container));
        }
        if (c.remote.connect_timeout <= 0 || c.remote.timeout <= 0) {
            return err("remote timeouts must be positive");
        }
        if (c.remote.connect_timeout > c.remote.timeout) {
            return err(fmt::format("remote connect timeout ({}s) exceeds the call timeout ({}s)",
                                   c.remote.connect_timeout, c.remote.timeout));
        }
    }

    // Written so that NaN fails too
    if (!(c.matrix.brightness >= 0.0 && c.matrix.brightness <= 1.0)) {
        return err(fmt::format("matrix brightness must be within 0.0-1.0 (got {})",
                               c.matrix.brightness));
    }
    if (c.matrix.enabled) {
        if (c.matrix.width <= 0 || c.matrix.height <= 0) {
            return err("matrix width and height must be positive");
        }
        if (!c.simulate && c.matrix.device.empty()) {
            return err("matrix device path is required");
        }
    }

    if (c.panel.enabled && c.panel.nodes.empty()) {
        return err("node panel is enabled but no node pins are configured");
    }
    if (c.panel.self_test_step_ms < 0) {
        return err("self-test step delay cannot be negative");
    }

    if (c.self_test && !c.panel.enabled) {
        return err("--test needs the node panel, which is disabled for this monitor");
    }
    if (c.self_test && c.once) {
        return err("--test and --once cannot be combined");
    }

    // Every GPIO line is claimed from the same chip, so pins must not repeat
    std::set<unsigned> pins;
    auto claim = [&](unsigned pin, const std::string& what) -> Result<void> {
        if (!pins.insert(pin).second) {
            return Result<void>::Err(fmt::format("GPIO {} is assigned twice ({})", pin, what));
        }
        return Result<void>::Ok();
    };
    if (c.indicators.enabled) {
        auto r = claim(c.indicators.normal_pin, "normal indicator");
        if (r.is_err()) return r;
        r = claim(c.indicators.quantum_pin, "quantum indicator");
        if (r.is_err()) return r;
    }
    if (c.panel.enabled) {
        std::set<std::string> ids;
        for (const auto& n : c.panel.nodes) {
            if (n.node_id.empty() || !ids.insert(n.node_id).second) {
                return err(fmt::format("node '{}' is listed twice or empty", n.node_id));
            }
            auto r = claim(n.pin, "node " + n.node_id);
            if (r.is_err()) return r;
        }
    }
    if ((c.indicators.enabled || c.panel.enabled) && !c.simulate && c.gpio_chip.empty()) {
        return err("GPIO chip path is required");
    }

    return Result<void>::Ok();
}
