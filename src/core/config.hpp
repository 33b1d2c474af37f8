#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

enum class MonitorRole {
    Jobs,    // primary host: local squeue → indicators + matrix
    Nodes,   // secondary host: remote sinfo → node panel
};

// Local running-job query (squeue inside the monitored container)
struct JobSourceConfig {
    bool enabled = false;
    std::string docker_cmd;
    std::string container;                  // empty = run squeue on the host
    std::optional<std::string> slurm_user;
    int timeout = 30;
};

// Remote node-state query (sinfo on the controller host, over SSH)
struct RemoteSourceConfig {
    bool enabled = false;
    std::string host;
    std::string user;
    std::string container;                  // target scope on the remote host
    std::string docker_cmd;
    int connect_timeout = 5;
    int timeout = 10;
    std::vector<std::string> key_paths;
};

struct IndicatorConfig {
    bool enabled = false;
    unsigned normal_pin = 17;
    unsigned quantum_pin = 27;
};

// How (x, y) maps to the strip index on the physical matrix
enum class MatrixLayout {
    Rows,                // row-major, every row left→right
    Columns,             // column-major, every column top→bottom
    SerpentineRows,      // row-major, odd rows right→left
    SerpentineColumns,   // column-major, odd columns bottom→top
};

struct MatrixConfig {
    bool enabled = false;
    std::string device;
    std::string lock_path;
    int width = 24;
    int height = 8;
    MatrixLayout layout = MatrixLayout::SerpentineRows;
    double brightness = 0.5;
};

struct NodePin {
    std::string node_id;
    unsigned pin = 0;
};

struct NodePanelConfig {
    bool enabled = false;
    std::vector<NodePin> nodes;             // configuration order = self-test order
    int self_test_step_ms = 300;
    bool self_test_on_start = false;        // run the sequence once before polling
};

struct MonitorConfig {
    MonitorRole role = MonitorRole::Jobs;
    std::string quantum_partition;
    int interval_secs = 30;
    bool verbose = false;
    std::string log_file;
    bool simulate = false;
    bool self_test = false;
    bool once = false;
    std::string gpio_chip;

    JobSourceConfig jobs;
    RemoteSourceConfig remote;
    IndicatorConfig indicators;
    MatrixConfig matrix;
    NodePanelConfig panel;
};

// Role defaults: jobs = local squeue + indicators + matrix every 30s,
// nodes = remote sinfo + node panel every 5s.
MonitorConfig default_config(MonitorRole role);

// Overlay a YAML config file / document onto config. Keys that are absent
// keep their current value.
Result<void> overlay_config_file(MonitorConfig& config, const fs::path& path);
Result<void> overlay_config_text(MonitorConfig& config, const std::string& yaml);

// Reject invalid or contradictory settings before the loop starts.
Result<void> validate_config(const MonitorConfig& config);

// Names used on the command line and in YAML
const char* role_name(MonitorRole role);
std::optional<MonitorRole> parse_role(const std::string& name);
const char* layout_name(MatrixLayout layout);
std::optional<MatrixLayout> parse_layout(const std::string& name);
