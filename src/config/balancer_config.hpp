// src/config/balancer_config.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "control/engine_params.hpp"
#include "control/soc_estimator.hpp"
#include "power/platform.hpp"
#include "utils/influx.hpp"

namespace config {

struct DaemonSettings {
    double interval_s = 1.0;
    std::string log_level = "info";
    std::string log_file;                  // Empty = stderr only
    std::string csv_log;                   // Empty = no CSV cycle log
    bool dry_run = false;                  // Decide and log, never touch hardware
    int max_consecutive_failures = 0;      // 0 = keep going forever
    uint64_t cycles = 0;                   // 0 = run until signalled
};

struct PlatformSettings {
    std::string model = "auto";            // auto | pinephone | pinephone-pro
    std::string sysfs_root = "/sys";

    // Optional overrides of the built-in profile
    std::vector<int> limit_steps_mA;
    std::optional<int> default_limit_mA;
    std::optional<bool> current_sign_unreliable;
};

struct TelemetrySettings {
    std::string source = "sysfs";          // sysfs | lua | replay
    std::string lua_script;
    std::string replay_csv;
};

/**
 * BalancerConfig - Loads daemon and engine parameters from YAML
 *
 * Usage:
 *   auto cfg = BalancerConfig::load("/etc/kbd-balancer.yaml");
 *   cfg.apply_platform(power::profile_for(model));
 *   cfg.validate();
 *
 * Falls back to built-in defaults if the file does not exist.
 */
class BalancerConfig {
public:
    DaemonSettings daemon;
    PlatformSettings platform;
    TelemetrySettings telemetry;
    utils::InfluxExporter::Config influx;

    // Platform fields (steps, default, quirk) are filled by apply_platform()
    control::EngineParams engine;

    std::vector<control::VoltageSocEstimator::Point> keyboard_soc_curve =
        control::VoltageSocEstimator::default_curve();
    int keyboard_internal_resistance_mohm = 0;

    /**
     * Load config from YAML file
     * @param yaml_path Path to YAML file
     * @return BalancerConfig with loaded parameters
     * @throws std::runtime_error if file exists but is invalid
     */
    static BalancerConfig load(const std::string& yaml_path);

    static BalancerConfig get_default();

    /**
     * Copy the hardware profile into the engine parameters, keeping any
     * platform overrides from the config file.
     */
    void apply_platform(const power::PlatformProfile& profile);

    /**
     * Validate parameters
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;

    BalancerConfig() = default;
};

} // namespace config
