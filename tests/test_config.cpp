#include <gtest/gtest.h>
#include <cli/options.hpp>
#include <core/config.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>

// ── Defaults ────────────────────────────────────────────────

TEST(Config, JobsDefaults) {
    auto c = default_config(MonitorRole::Jobs);
    EXPECT_EQ(c.interval_secs, 30);
    EXPECT_TRUE(c.jobs.enabled);
    EXPECT_TRUE(c.indicators.enabled);
    EXPECT_TRUE(c.matrix.enabled);
    EXPECT_FALSE(c.remote.enabled);
    EXPECT_FALSE(c.panel.enabled);
    EXPECT_EQ(c.jobs.container, "login");
    EXPECT_EQ(c.quantum_partition, "quantum");
    EXPECT_EQ(c.indicators.normal_pin, 17u);
    EXPECT_EQ(c.indicators.quantum_pin, 27u);
    EXPECT_DOUBLE_EQ(c.matrix.brightness, 0.5);
    EXPECT_TRUE(validate_config(c).is_ok());
}

TEST(Config, NodesDefaults) {
    auto c = default_config(MonitorRole::Nodes);
    EXPECT_EQ(c.interval_secs, 5);
    EXPECT_TRUE(c.remote.enabled);
    EXPECT_TRUE(c.panel.enabled);
    EXPECT_FALSE(c.jobs.enabled);
    EXPECT_EQ(c.remote.host, "192.168.4.160");
    EXPECT_EQ(c.remote.user, "rasqberry");
    ASSERT_EQ(c.panel.nodes.size(), 6u);
    EXPECT_EQ(c.panel.nodes[0].node_id, "c1");
    EXPECT_EQ(c.panel.nodes[0].pin, 17u);
    EXPECT_EQ(c.panel.nodes[5].node_id, "q2");
    EXPECT_EQ(c.panel.nodes[5].pin, 25u);
    EXPECT_TRUE(validate_config(c).is_ok());
}

// ── YAML ────────────────────────────────────────────────────

TEST(Config, YamlOverlay) {
    auto c = default_config(MonitorRole::Nodes);
    auto r = overlay_config_text(c, R"(
interval: 7
remote:
  host: ctl.example
  keys: [/etc/slurmled/id_ed25519]
node_panel:
  self_test_step_ms: 50
  pins:
    n2: 5
    n1: 6
matrix:
  layout: columns
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(c.interval_secs, 7);
    EXPECT_EQ(c.remote.host, "ctl.example");
    EXPECT_EQ(c.remote.user, "rasqberry");   // untouched
    ASSERT_EQ(c.remote.key_paths.size(), 1u);
    ASSERT_EQ(c.panel.nodes.size(), 2u);
    EXPECT_EQ(c.panel.nodes[0].node_id, "n2");   // document order
    EXPECT_EQ(c.panel.nodes[1].pin, 6u);
    EXPECT_EQ(c.panel.self_test_step_ms, 50);
    EXPECT_FALSE(c.panel.self_test_on_start);
    EXPECT_EQ(c.matrix.layout, MatrixLayout::Columns);
}

TEST(Config, YamlPinList) {
    auto c = default_config(MonitorRole::Nodes);
    auto r = overlay_config_text(c, "node_panel:\n  pins:\n    - {id: c1, pin: 4}\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(c.panel.nodes.size(), 1u);
    EXPECT_EQ(c.panel.nodes[0].pin, 4u);

    r = overlay_config_text(c, "node_panel:\n  self_test_on_start: true\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(c.panel.self_test_on_start);
}

TEST(Config, YamlNodeIdsLowerCased) {
    auto c = default_config(MonitorRole::Nodes);
    auto r = overlay_config_text(c, "node_panel:\n  pins:\n    C1: 4\n    Q1: 5\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(c.panel.nodes.size(), 2u);
    EXPECT_EQ(c.panel.nodes[0].node_id, "c1");
    EXPECT_EQ(c.panel.nodes[1].node_id, "q1");
}

TEST(Config, YamlErrors) {
    auto c = default_config(MonitorRole::Jobs);
    EXPECT_TRUE(overlay_config_text(c, "interval: [1, 2").is_err());
    EXPECT_TRUE(overlay_config_text(c, "matrix:\n  layout: spiral\n").is_err());
    EXPECT_TRUE(overlay_config_text(c, "- a\n- b\n").is_err());
}

TEST(Config, YamlTypeMismatchIsAnError) {
    auto c = default_config(MonitorRole::Jobs);
    auto r = overlay_config_text(c, "interval: fast\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(c.interval_secs, 30);

    c = default_config(MonitorRole::Jobs);
    EXPECT_TRUE(overlay_config_text(c, "matrix:\n  brightness: high\n").is_err());
    EXPECT_TRUE(overlay_config_text(c, "indicators:\n  normal_pin: green\n").is_err());
    EXPECT_TRUE(overlay_config_text(c, "jobs:\n  enabled: maybe\n").is_err());
    EXPECT_TRUE(overlay_config_text(c, "node_panel:\n  pins:\n    c1: x\n").is_err());
}

TEST(Config, YamlEmptyUserClearsFilter) {
    auto c = default_config(MonitorRole::Jobs);
    c.jobs.slurm_user = "alice";
    auto r = overlay_config_text(c, "jobs:\n  user:\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(c.jobs.slurm_user.has_value());
}

TEST(Config, MissingFile) {
    auto c = default_config(MonitorRole::Jobs);
    EXPECT_TRUE(overlay_config_file(c, "/nonexistent/slurmled.yaml").is_err());
}

// ── Validation ──────────────────────────────────────────────

TEST(Config, RejectsBadSettings) {
    auto base = default_config(MonitorRole::Jobs);

    auto c = base;
    c.matrix.brightness = 1.5;
    EXPECT_TRUE(validate_config(c).is_err());

    c = base;
    c.matrix.brightness = std::nan("");
    EXPECT_TRUE(validate_config(c).is_err());

    c = base;
    c.interval_secs = 0;
    EXPECT_TRUE(validate_config(c).is_err());

    c = base;
    c.indicators.quantum_pin = c.indicators.normal_pin;
    EXPECT_TRUE(validate_config(c).is_err());

    c = base;
    c.jobs.container = "login; rm -rf /";
    EXPECT_TRUE(validate_config(c).is_err());

    c = base;
    c.jobs.enabled = false;
    c.indicators.enabled = false;
    c.matrix.enabled = false;
    EXPECT_TRUE(validate_config(c).is_err());
}

TEST(Config, SelfTestRules) {
    auto c = default_config(MonitorRole::Jobs);
    c.self_test = true;
    EXPECT_TRUE(validate_config(c).is_err());   // no panel

    c = default_config(MonitorRole::Nodes);
    c.self_test = true;
    EXPECT_TRUE(validate_config(c).is_ok());
    c.once = true;
    EXPECT_TRUE(validate_config(c).is_err());
}

TEST(Config, PanelNeedsNodes) {
    auto c = default_config(MonitorRole::Nodes);
    c.panel.nodes.clear();
    EXPECT_TRUE(validate_config(c).is_err());

    c = default_config(MonitorRole::Nodes);
    c.panel.nodes.push_back({"c1", 5});
    EXPECT_TRUE(validate_config(c).is_err());   // duplicate node id
}

// ── Command line ────────────────────────────────────────────

TEST(CliArgs, ParsesFlagsAndValues) {
    auto r = parse_cli_args({"-c", "slurm", "--interval=10", "-v", "--simulate", "--once",
                             "--key", "a", "--key", "b", "--matrix-brightness", "0.2"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(*r.value.container, "slurm");
    EXPECT_EQ(*r.value.interval, 10);
    EXPECT_TRUE(r.value.verbose);
    EXPECT_TRUE(r.value.simulate);
    EXPECT_TRUE(r.value.once);
    EXPECT_EQ(r.value.keys, std::vector<std::string>({"a", "b"}));
    EXPECT_DOUBLE_EQ(*r.value.brightness, 0.2);
}

TEST(CliArgs, Errors) {
    EXPECT_TRUE(parse_cli_args({"--bogus"}).is_err());
    EXPECT_TRUE(parse_cli_args({"--interval"}).is_err());
    EXPECT_TRUE(parse_cli_args({"-i", "fast"}).is_err());
    EXPECT_TRUE(parse_cli_args({"--normal-pin", "-1"}).is_err());
    EXPECT_TRUE(parse_cli_args({"--once=yes"}).is_err());
    EXPECT_TRUE(parse_cli_args({"--interval", "4294967297"}).is_err());
    EXPECT_TRUE(parse_cli_args({"--quantum-pin", "99999999999"}).is_err());
}

TEST(CliArgs, CommandLineBeatsFileBeatsDefaults) {
    auto path = std::filesystem::temp_directory_path() / "slurmled_test_precedence.yaml";
    {
        std::ofstream out(path);
        out << "interval: 12\nquantum_partition: qpu\nmatrix:\n  brightness: 0.9\n";
    }

    auto cli = parse_cli_args({"--config", path.string(), "-i", "3", "--no-matrix"});
    ASSERT_TRUE(cli.is_ok()) << cli.error;
    auto c = build_config(MonitorRole::Jobs, cli.value);
    std::filesystem::remove(path);

    ASSERT_TRUE(c.is_ok()) << c.error;
    EXPECT_EQ(c.value.interval_secs, 3);               // command line
    EXPECT_EQ(c.value.quantum_partition, "qpu");       // file
    EXPECT_DOUBLE_EQ(c.value.matrix.brightness, 0.9);  // file
    EXPECT_FALSE(c.value.matrix.enabled);              // command line
    EXPECT_EQ(c.value.jobs.container, "login");        // default
}

TEST(CliArgs, ExtraKeysTriedFirst) {
    auto cli = parse_cli_args({"--key", "/root/deploy_key"});
    ASSERT_TRUE(cli.is_ok());
    auto c = build_config(MonitorRole::Nodes, cli.value);
    ASSERT_TRUE(c.is_ok()) << c.error;
    ASSERT_EQ(c.value.remote.key_paths.size(), 3u);
    EXPECT_EQ(c.value.remote.key_paths[0], "/root/deploy_key");
}

TEST(CliArgs, ValidationFailureSurfaces) {
    auto cli = parse_cli_args({"--matrix-brightness", "2"});
    ASSERT_TRUE(cli.is_ok());
    EXPECT_TRUE(build_config(MonitorRole::Jobs, cli.value).is_err());
}

TEST(CliArgs, NanBrightnessRejected) {
    auto cli = parse_cli_args({"--matrix-brightness", "nan"});
    ASSERT_TRUE(cli.is_ok());
    EXPECT_TRUE(build_config(MonitorRole::Jobs, cli.value).is_err());
}
