// src/app/balancer_main.cpp
#include "app/balancer_app.hpp"
#include "config/balancer_config.hpp"
#include "control/decision_engine.hpp"
#include "control/soc_estimator.hpp"
#include "power/platform.hpp"
#include "power/quantizing_actuator.hpp"
#include "power/replay_telemetry.hpp"
#include "power/sysfs_actuator.hpp"
#include "power/sysfs_telemetry.hpp"
#include "sim/lua_scenario.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <getopt.h>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

void install_signal_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nBalances charge between a PinePhone and its keyboard case battery\n");
    printf("by stepping the phone's USB input current limit.\n");
    printf("\nOptions:\n");
    printf("  --config PATH         Config YAML (default: /etc/kbd-balancer.yaml)\n");
    printf("  --dry-run             Decide and log, never write limits\n");
    printf("  --cycles N            Stop after N cycles (default: run until signalled)\n");
    printf("  --interval SEC        Cycle interval in seconds (default: 1.0)\n");
    printf("  --replay CSV          Replay recorded telemetry instead of sysfs\n");
    printf("  --lua SCRIPT          Run a Lua bench scenario instead of sysfs\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off\n");
    printf("  --log-file PATH       Mirror log output to a file\n");
    printf("  --csv PATH            Write a per-cycle CSV log (replayable)\n");
    printf("  --influx              Export cycles to InfluxDB (see influx: in config)\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExamples:\n");
    printf("  # Watch what the balancer would do on this phone:\n");
    printf("  %s --dry-run --log-level debug\n\n", prog_name);
    printf("  # Re-run a recorded session as fast as possible:\n");
    printf("  %s --replay session.csv --interval 0\n\n", prog_name);
    printf("  # Bench scenario:\n");
    printf("  %s --lua config/lua/bench.lua --interval 0 --cycles 600\n\n", prog_name);
}

struct CliOverrides {
    std::string config_path = "/etc/kbd-balancer.yaml";
    bool dry_run = false;
    bool influx = false;
    std::string cycles;
    std::string interval;
    std::string replay;
    std::string lua;
    std::string log_level;
    std::string log_file;
    std::string csv;
};

bool parse_uint64(const char* text, uint64_t& out) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || text[0] == '-') return false;
    out = v;
    return true;
}

bool parse_seconds(const char* text, double& out) {
    char* end = nullptr;
    const double v = std::strtod(text, &end);
    if (end == text || *end != '\0' || v < 0.0) return false;
    out = v;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliOverrides cli;

    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"dry-run",   no_argument,       0, 'n'},
        {"cycles",    required_argument, 0, 'N'},
        {"interval",  required_argument, 0, 'i'},
        {"replay",    required_argument, 0, 'r'},
        {"lua",       required_argument, 0, 'L'},
        {"log-level", required_argument, 0, 'l'},
        {"log-file",  required_argument, 0, 'f'},
        {"csv",       required_argument, 0, 'C'},
        {"influx",    no_argument,       0, 'I'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c': cli.config_path = optarg; break;
            case 'n': cli.dry_run = true; break;
            case 'N': cli.cycles = optarg; break;
            case 'i': cli.interval = optarg; break;
            case 'r': cli.replay = optarg; break;
            case 'L': cli.lua = optarg; break;
            case 'l': cli.log_level = optarg; break;
            case 'f': cli.log_file = optarg; break;
            case 'C': cli.csv = optarg; break;
            case 'I': cli.influx = true; break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    if (!cli.replay.empty() && !cli.lua.empty()) {
        fprintf(stderr, "Error: --replay and --lua are mutually exclusive\n");
        return 1;
    }

    // ========================================================================
    // Configuration: YAML first, command line on top
    // ========================================================================
    config::BalancerConfig cfg;
    try {
        cfg = config::BalancerConfig::load(cli.config_path);
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }

    if (cli.dry_run) cfg.daemon.dry_run = true;
    if (cli.influx) cfg.influx.enabled = true;
    if (!cli.log_level.empty()) cfg.daemon.log_level = cli.log_level;
    if (!cli.log_file.empty()) cfg.daemon.log_file = cli.log_file;
    if (!cli.csv.empty()) cfg.daemon.csv_log = cli.csv;
    if (!cli.cycles.empty() && !parse_uint64(cli.cycles.c_str(), cfg.daemon.cycles)) {
        fprintf(stderr, "Error: Invalid cycle count: %s\n", cli.cycles.c_str());
        return 1;
    }
    if (!cli.interval.empty() && !parse_seconds(cli.interval.c_str(), cfg.daemon.interval_s)) {
        fprintf(stderr, "Error: Invalid interval: %s\n", cli.interval.c_str());
        return 1;
    }
    if (!cli.replay.empty()) {
        cfg.telemetry.source = "replay";
        cfg.telemetry.replay_csv = cli.replay;
    }
    if (!cli.lua.empty()) {
        cfg.telemetry.source = "lua";
        cfg.telemetry.lua_script = cli.lua;
    }

    utils::LogLevel level = utils::LogLevel::Info;
    if (!utils::parse_level(cfg.daemon.log_level, level)) {
        fprintf(stderr, "Error: Invalid log level: %s\n", cfg.daemon.log_level.c_str());
        return 1;
    }
    utils::set_level(level);
    utils::LogFileGuard log_file(cfg.daemon.log_file);
    if (!cfg.daemon.log_file.empty() && !log_file.is_open()) {
        LOG_WARN("Logging to stderr only");
    }

    // ========================================================================
    // Platform: explicit model, else probe sysfs
    // ========================================================================
    power::Model model = power::Model::PinePhone;
    if (cfg.platform.model == "auto") {
        auto detected = power::detect_model(cfg.platform.sysfs_root);
        if (detected) {
            model = *detected;
            LOG_INFO("Detected %s", power::to_string(model));
        } else if (cfg.telemetry.source == "sysfs") {
            LOG_ERROR("Unknown hardware under %s; set platform.model in %s",
                      cfg.platform.sysfs_root.c_str(), cli.config_path.c_str());
            return 1;
        } else {
            LOG_WARN("Hardware not detected, assuming %s for %s telemetry",
                     power::to_string(model), cfg.telemetry.source.c_str());
        }
    } else if (!power::parse_model(cfg.platform.model, model)) {
        LOG_ERROR("Invalid platform model: %s", cfg.platform.model.c_str());
        return 1;
    }

    power::PlatformProfile profile = power::profile_for(model);
    cfg.apply_platform(profile);
    profile.steps = cfg.engine.steps;
    profile.default_limit_mA = cfg.engine.default_limit_mA;
    profile.current_sign_unreliable = cfg.engine.current_sign_unreliable;

    try {
        cfg.validate();
    } catch (const std::exception& e) {
        LOG_ERROR("[BalancerConfig] %s", e.what());
        return 1;
    }
    cfg.print_summary();

    // ========================================================================
    // Engine
    // ========================================================================
    control::DecisionEngine engine(
        cfg.engine,
        std::make_unique<control::VoltageSocEstimator>(cfg.keyboard_soc_curve,
                                                       cfg.keyboard_internal_resistance_mohm));

    // ========================================================================
    // Telemetry + actuator
    // ========================================================================
    std::unique_ptr<power::TelemetrySource> telemetry;
    std::unique_ptr<power::LimitActuator> actuator;
    power::LimitActuator* active_actuator = nullptr;

    if (cfg.telemetry.source == "lua") {
        auto scenario = std::make_unique<sim::LuaScenario>(cfg.engine.steps);
        if (!scenario->init(cfg.telemetry.lua_script)) {
            LOG_ERROR("Failed to load Lua scenario: %s", cfg.telemetry.lua_script.c_str());
            return 1;
        }
        active_actuator = scenario.get();
        telemetry = std::move(scenario);
    } else if (cfg.telemetry.source == "replay") {
        auto replay = std::make_unique<power::ReplayTelemetry>();
        if (!replay->load(cfg.telemetry.replay_csv)) {
            return 1;
        }
        telemetry = std::move(replay);
    } else {
        telemetry = std::make_unique<power::SysfsTelemetry>(profile, cfg.platform.sysfs_root);
    }

    if (!active_actuator) {
        if (cfg.daemon.dry_run || cfg.telemetry.source == "replay") {
            actuator = std::make_unique<power::QuantizingActuator>(cfg.engine.steps);
        } else {
            actuator = std::make_unique<power::SysfsLimitActuator>(
                profile, cfg.engine.keyboard_input_budget_mA, cfg.platform.sysfs_root);
        }
        active_actuator = actuator.get();
    }

    std::unique_ptr<utils::InfluxExporter> influx;
    if (cfg.influx.enabled) {
        try {
            influx = std::make_unique<utils::InfluxExporter>(cfg.influx);
        } catch (const std::exception& e) {
            LOG_ERROR("[InfluxDB] %s, export disabled", e.what());
        }
    }

    // ========================================================================
    // Run
    // ========================================================================
    app::BalancerAppConfig app_cfg;
    app_cfg.interval_s = cfg.daemon.interval_s;
    app_cfg.max_cycles = cfg.daemon.cycles;
    app_cfg.max_consecutive_failures = cfg.daemon.max_consecutive_failures;
    app_cfg.csv_log_path = cfg.daemon.csv_log;

    install_signal_handlers();

    app::BalancerApp balancer(app_cfg, engine, *telemetry, *active_actuator, influx.get());
    return balancer.run(g_stop);
}
