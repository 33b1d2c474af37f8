#include "slurmled_cli.hpp"
#include "options.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <display/display_driver.hpp>
#include <managers/last_known_good.hpp>
#include <managers/poll_loop.hpp>
#include <managers/state_source.hpp>
#include <platform/signals.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <iostream>

SlurmledApp::SlurmledApp(MonitorConfig config)
    : config_(std::move(config)) {}

void SlurmledApp::set_job_runner(std::unique_ptr<CommandRunner> runner) {
    job_runner_ = std::move(runner);
}

void SlurmledApp::set_node_runner(std::unique_ptr<CommandRunner> runner) {
    node_runner_ = std::move(runner);
}

void SlurmledApp::set_backend(std::unique_ptr<HardwareBackend> backend) {
    backend_ = std::move(backend);
}

int SlurmledApp::run(const std::atomic<bool>& stop) {
    const MonitorConfig& c = config_;

    // Resolve the controller before claiming anything
    if (!c.self_test && c.remote.enabled && !node_runner_) {
        std::string err;
        if (!platform::host_resolves(c.remote.host, err)) {
            log_error(err);
            std::cout << theme::fail(err);
            return EXIT_CONFIG_FAILURE;
        }
    }

    if (!backend_) backend_ = make_backend(c);

    std::unique_ptr<DisplayDriver> display;
    try {
        display = std::make_unique<DisplayDriver>(std::move(backend_), c);
    } catch (const HardwareClaimError& e) {
        log_error(fmt::format("hardware claim failed: {}", e.what()));
        std::cout << theme::fail(e.what());
        return EXIT_HARDWARE_CLAIM;
    }
    log_info(fmt::format("slurmled {} ({} monitor, {} outputs)", SLURMLED_VERSION,
                         role_name(c.role), display->backend_name()));

    if (c.self_test || (c.panel.enabled && c.panel.self_test_on_start)) {
        try {
            display->self_test();
        } catch (const std::exception&) {
            // Lights switched on so far must not outlive the process
            display->shutdown();
            throw;
        }
        if (c.self_test) {
            display->shutdown();
            return EXIT_CLEAN;
        }
    }

    // Injected runners only stand in for sources the config enables
    if (!c.jobs.enabled) job_runner_.reset();
    else if (!job_runner_) job_runner_ = make_job_runner(c);
    if (!c.remote.enabled) node_runner_.reset();
    else if (!node_runner_) node_runner_ = make_node_runner(c);
    StateSource source(c, std::move(job_runner_), std::move(node_runner_));
    if (source.jobs_enabled()) {
        log_info(fmt::format("Jobs: squeue in {}", c.jobs.container.empty()
                                 ? std::string("this host") : "container " + c.jobs.container));
    }
    if (source.nodes_enabled()) {
        log_info(fmt::format("Nodes: sinfo on {}@{}", c.remote.user, c.remote.host));
    }

    LastKnownGood lkg;
    PollLoop loop(source, *display, lkg, c, stop);
    loop.run();
    return EXIT_CLEAN;
}

int run_monitor(MonitorRole role, const std::vector<std::string>& args) {
    auto parsed = parse_cli_args(args);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step(fmt::format("Usage: slurmled {} [options]  (see --help)",
                                             role_name(role)));
        return EXIT_CONFIG_FAILURE;
    }
    if (parsed.value.help) {
        print_usage();
        return EXIT_CLEAN;
    }

    auto config = build_config(role, parsed.value);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return EXIT_CONFIG_FAILURE;
    }

    log_init(config.value.verbose ? LogLevel::Debug : LogLevel::Info, config.value.log_file);
    platform::install_shutdown_handlers();

    SlurmledApp app(std::move(config.value));
    int rc = app.run(platform::shutdown_flag());

    platform::remove_shutdown_handlers();
    return rc;
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("slurmled jobs [options]",
                                  "Running jobs -> indicators + matrix");
    std::cout << theme::usage_row("slurmled nodes [options]",
                                  "Node allocation over SSH -> node panel");
    std::cout << theme::usage_row("slurmled --version", "Print version");
    std::cout << theme::usage_row("slurmled --help", "Show this help");
    std::cout << theme::section("Options");
    std::cout << options_help();
    std::cout << theme::section("Exit codes");
    std::cout << "    0 clean shutdown, 1 configuration error, 2 hardware claim failure\n\n";
}
