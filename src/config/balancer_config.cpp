// src/config/balancer_config.cpp
#include "config/balancer_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

namespace config {

BalancerConfig BalancerConfig::load(const std::string& yaml_path) {
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[BalancerConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[BalancerConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[BalancerConfig] Loading config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        BalancerConfig cfg = get_default();

        // ====================================================================
        // daemon
        // ====================================================================
        if (root["daemon"]) {
            auto d = root["daemon"];
            cfg.daemon.interval_s = d["interval_s"].as<double>(cfg.daemon.interval_s);
            cfg.daemon.log_level = d["log_level"].as<std::string>(cfg.daemon.log_level);
            cfg.daemon.log_file = d["log_file"].as<std::string>(cfg.daemon.log_file);
            cfg.daemon.csv_log = d["csv_log"].as<std::string>(cfg.daemon.csv_log);
            cfg.daemon.dry_run = d["dry_run"].as<bool>(cfg.daemon.dry_run);
            cfg.daemon.max_consecutive_failures =
                d["max_consecutive_failures"].as<int>(cfg.daemon.max_consecutive_failures);
            cfg.daemon.cycles = d["cycles"].as<uint64_t>(cfg.daemon.cycles);
        }

        // ====================================================================
        // platform
        // ====================================================================
        if (root["platform"]) {
            auto p = root["platform"];
            cfg.platform.model = p["model"].as<std::string>(cfg.platform.model);
            cfg.platform.sysfs_root = p["sysfs_root"].as<std::string>(cfg.platform.sysfs_root);
            if (p["limit_steps_ma"]) {
                cfg.platform.limit_steps_mA = p["limit_steps_ma"].as<std::vector<int>>();
            }
            if (p["default_limit_ma"]) {
                cfg.platform.default_limit_mA = p["default_limit_ma"].as<int>();
            }
            if (p["current_sign_unreliable"]) {
                cfg.platform.current_sign_unreliable = p["current_sign_unreliable"].as<bool>();
            }
        }

        // ====================================================================
        // engine
        // ====================================================================
        if (root["engine"]) {
            auto e = root["engine"];
            auto& ep = cfg.engine;
            ep.critical_soc_pct = e["critical_soc_pct"].as<int>(ep.critical_soc_pct);
            ep.balance_margin_pct = e["balance_margin_pct"].as<int>(ep.balance_margin_pct);
            ep.light_load_mA = e["light_load_ma"].as<int>(ep.light_load_mA);
            ep.step_holdoff_cycles = e["step_holdoff_cycles"].as<int>(ep.step_holdoff_cycles);
            ep.keyboard_input_budget_mA =
                e["keyboard_input_budget_ma"].as<int>(ep.keyboard_input_budget_mA);

            auto& dp = ep.direction;
            dp.hysteresis_cycles = e["direction_hysteresis_cycles"].as<int>(dp.hysteresis_cycles);
            dp.voltage_window = e["voltage_window"].as<int>(dp.voltage_window);
            dp.voltage_trend_mV = e["voltage_trend_mv"].as<int>(dp.voltage_trend_mV);
            dp.current_noise_mA = e["current_noise_ma"].as<int>(dp.current_noise_mA);
            dp.low_limit_mA = e["low_limit_ma"].as<int>(dp.low_limit_mA);
            dp.near_limit_pct = e["near_limit_pct"].as<int>(dp.near_limit_pct);
        }

        // ====================================================================
        // plausibility
        // ====================================================================
        if (root["plausibility"]) {
            auto pl = root["plausibility"];
            auto& lim = cfg.engine.plausibility;
            lim.min_voltage_mV = pl["min_voltage_mv"].as<int>(lim.min_voltage_mV);
            lim.max_voltage_mV = pl["max_voltage_mv"].as<int>(lim.max_voltage_mV);
            lim.max_abs_current_mA = pl["max_abs_current_ma"].as<int>(lim.max_abs_current_mA);
            lim.max_limit_mA = pl["max_limit_ma"].as<int>(lim.max_limit_mA);
        }

        // ====================================================================
        // keyboard SoC proxy
        // ====================================================================
        if (root["keyboard_soc_curve"]) {
            cfg.keyboard_soc_curve.clear();
            for (const auto& pt : root["keyboard_soc_curve"]) {
                if (!pt.IsSequence() || pt.size() != 2) {
                    throw std::runtime_error("keyboard_soc_curve entries must be [mV, pct]");
                }
                cfg.keyboard_soc_curve.push_back({pt[0].as<int>(), pt[1].as<int>()});
            }
        }
        if (root["keyboard_internal_resistance_mohm"]) {
            cfg.keyboard_internal_resistance_mohm = root["keyboard_internal_resistance_mohm"].as<int>();
        }

        // ====================================================================
        // telemetry
        // ====================================================================
        if (root["telemetry"]) {
            auto t = root["telemetry"];
            cfg.telemetry.source = t["source"].as<std::string>(cfg.telemetry.source);
            cfg.telemetry.lua_script = t["lua_script"].as<std::string>(cfg.telemetry.lua_script);
            cfg.telemetry.replay_csv = t["replay_csv"].as<std::string>(cfg.telemetry.replay_csv);
        }

        // ====================================================================
        // influx
        // ====================================================================
        if (root["influx"]) {
            auto i = root["influx"];
            cfg.influx.enabled = i["enabled"].as<bool>(cfg.influx.enabled);
            cfg.influx.url = i["url"].as<std::string>(cfg.influx.url);
            cfg.influx.token = i["token"].as<std::string>(cfg.influx.token);
            cfg.influx.org = i["org"].as<std::string>(cfg.influx.org);
            cfg.influx.bucket = i["bucket"].as<std::string>(cfg.influx.bucket);
            cfg.influx.write_interval_s = i["write_interval_s"].as<double>(cfg.influx.write_interval_s);
        }

        cfg.validate();

        LOG_INFO("[BalancerConfig] Successfully loaded: %s", yaml_path.c_str());
        return cfg;

    } catch (const YAML::Exception& e) {
        throw std::runtime_error(
            std::string("[BalancerConfig] YAML parse error: ") + e.what()
        );
    } catch (const std::exception& e) {
        throw std::runtime_error(
            std::string("[BalancerConfig] Load error: ") + e.what()
        );
    }
}

BalancerConfig BalancerConfig::get_default() {
    return BalancerConfig{};
}

void BalancerConfig::apply_platform(const power::PlatformProfile& profile) {
    engine.steps = platform.limit_steps_mA.empty() ? profile.steps
                                                    : power::LimitSteps(platform.limit_steps_mA);
    engine.default_limit_mA = platform.default_limit_mA.value_or(
        platform.limit_steps_mA.empty() ? profile.default_limit_mA : engine.steps.min());
    engine.current_sign_unreliable =
        platform.current_sign_unreliable.value_or(profile.current_sign_unreliable);
}

void BalancerConfig::validate() const {
    // Daemon
    if (daemon.interval_s < 0.0) {
        throw std::runtime_error("Invalid interval_s: must be >= 0");
    }
    utils::LogLevel lvl;
    if (!utils::parse_level(daemon.log_level, lvl)) {
        throw std::runtime_error("Invalid log_level: " + daemon.log_level);
    }
    if (daemon.max_consecutive_failures < 0) {
        throw std::runtime_error("Invalid max_consecutive_failures: must be >= 0");
    }

    // Platform
    power::Model model;
    if (platform.model != "auto" && !power::parse_model(platform.model, model)) {
        throw std::runtime_error("Invalid platform model: " + platform.model);
    }
    if (!platform.limit_steps_mA.empty() && !power::LimitSteps(platform.limit_steps_mA).valid()) {
        throw std::runtime_error("Invalid limit_steps_ma: must be positive and strictly ascending");
    }

    // Engine (platform part only once a profile has been applied)
    if (!engine.steps.empty()) {
        if (!engine.steps.valid()) {
            throw std::runtime_error("Invalid limit steps: must be positive and strictly ascending");
        }
        if (!engine.steps.contains(engine.default_limit_mA)) {
            throw std::runtime_error("Invalid default_limit_ma: must be one of the limit steps");
        }
    }
    if (engine.critical_soc_pct < 0 || engine.critical_soc_pct > 100) {
        throw std::runtime_error("Invalid critical_soc_pct: must be 0..100");
    }
    if (engine.balance_margin_pct < 0 || engine.balance_margin_pct > 100) {
        throw std::runtime_error("Invalid balance_margin_pct: must be 0..100");
    }
    if (engine.light_load_mA < 0) {
        throw std::runtime_error("Invalid light_load_ma: must be >= 0");
    }
    if (engine.step_holdoff_cycles < 0) {
        throw std::runtime_error("Invalid step_holdoff_cycles: must be >= 0");
    }
    if (engine.keyboard_input_budget_mA <= 0) {
        throw std::runtime_error("Invalid keyboard_input_budget_ma: must be > 0");
    }
    if (engine.direction.hysteresis_cycles < 1) {
        throw std::runtime_error("Invalid direction_hysteresis_cycles: must be >= 1");
    }
    if (engine.direction.voltage_window < 2) {
        throw std::runtime_error("Invalid voltage_window: must be >= 2");
    }
    if (engine.direction.voltage_trend_mV <= 0) {
        throw std::runtime_error("Invalid voltage_trend_mv: must be > 0");
    }
    if (engine.direction.near_limit_pct <= 0 || engine.direction.near_limit_pct > 100) {
        throw std::runtime_error("Invalid near_limit_pct: must be 1..100");
    }

    const auto& lim = engine.plausibility;
    if (lim.min_voltage_mV >= lim.max_voltage_mV) {
        throw std::runtime_error("Invalid plausibility: min_voltage_mv must be < max_voltage_mv");
    }
    if (lim.max_abs_current_mA <= 0 || lim.max_limit_mA <= 0) {
        throw std::runtime_error("Invalid plausibility: current bounds must be > 0");
    }

    // Keyboard SoC proxy
    if (!control::VoltageSocEstimator::valid_curve(keyboard_soc_curve)) {
        throw std::runtime_error("Invalid keyboard_soc_curve: need >= 2 points ascending in mV and pct");
    }
    if (keyboard_internal_resistance_mohm < 0) {
        throw std::runtime_error("Invalid keyboard_internal_resistance_mohm: must be >= 0");
    }

    // Telemetry
    if (telemetry.source != "sysfs" && telemetry.source != "lua" && telemetry.source != "replay") {
        throw std::runtime_error("Invalid telemetry source: " + telemetry.source);
    }
    if (telemetry.source == "lua" && telemetry.lua_script.empty()) {
        throw std::runtime_error("telemetry.source is lua but lua_script is empty");
    }
    if (telemetry.source == "replay" && telemetry.replay_csv.empty()) {
        throw std::runtime_error("telemetry.source is replay but replay_csv is empty");
    }

    if (influx.enabled && influx.url.empty()) {
        throw std::runtime_error("influx.enabled but influx.url is empty");
    }

    LOG_DEBUG("[BalancerConfig] Validation passed");
}

void BalancerConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Balancer Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Platform: %s (sysfs root %s)", platform.model.c_str(), platform.sysfs_root.c_str());
    if (!engine.steps.empty()) {
        std::string steps;
        for (int s : engine.steps.values()) {
            if (!steps.empty()) steps += ", ";
            steps += std::to_string(s);
        }
        LOG_INFO("Limit steps: [%s] mA, default %d mA", steps.c_str(), engine.default_limit_mA);
    }
    LOG_INFO("Current sign unreliable: %s", engine.current_sign_unreliable ? "yes" : "no");
    LOG_INFO("----------------------------------------");
    LOG_INFO("Critical SoC: %d%%", engine.critical_soc_pct);
    LOG_INFO("Balance margin: %d%%", engine.balance_margin_pct);
    LOG_INFO("Light load: %d mA", engine.light_load_mA);
    LOG_INFO("Step hold-off: %d cycles", engine.step_holdoff_cycles);
    LOG_INFO("Keyboard input budget: %d mA", engine.keyboard_input_budget_mA);
    LOG_INFO("Direction hysteresis: %d cycles, window %d, trend %d mV",
             engine.direction.hysteresis_cycles, engine.direction.voltage_window,
             engine.direction.voltage_trend_mV);
    LOG_INFO("----------------------------------------");
    LOG_INFO("Interval: %.2f s, telemetry: %s%s", daemon.interval_s, telemetry.source.c_str(),
             daemon.dry_run ? " (dry run)" : "");
    if (influx.enabled) {
        LOG_INFO("InfluxDB: %s (bucket %s)", influx.url.c_str(), influx.bucket.c_str());
    }
    LOG_INFO("========================================");
}

} // namespace config
