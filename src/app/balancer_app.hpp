// src/app/balancer_app.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "app/cycle_log.hpp"
#include "control/control_state.hpp"
#include "control/decision_engine.hpp"
#include "power/limit_actuator.hpp"
#include "power/telemetry_source.hpp"
#include "utils/influx.hpp"

namespace app {

struct BalancerAppConfig {
    double interval_s = 1.0;           // 0 = no pacing (replay, tests)
    uint64_t max_cycles = 0;           // 0 = until stopped or source finished
    int max_consecutive_failures = 0;  // 0 = never give up
    std::string csv_log_path;          // Empty = no CSV log
};

/**
 * BalancerApp - The control loop.
 *
 * Every cycle: read both batteries, decide, apply the phone input limit
 * (unless the decision is Pass) and the keyboard charge limit (when
 * requested and not already in effect), then log and export.
 *
 * The telemetry source, actuator and exporter are owned by the caller.
 */
class BalancerApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitTooManyFailures = 2;

    struct Stats {
        uint64_t cycles = 0;
        uint64_t failed_cycles = 0;
        uint64_t phone_writes = 0;
        uint64_t keyboard_writes = 0;
    };

    BalancerApp(BalancerAppConfig cfg,
                const control::DecisionEngine& engine,
                power::TelemetrySource& telemetry,
                power::LimitActuator& actuator,
                utils::InfluxExporter* influx = nullptr);

    /**
     * Run until stop is set, max_cycles is reached, the telemetry source
     * is exhausted or too many cycles in a row fail.
     *
     * @return kExitOk or kExitTooManyFailures
     */
    int run(const std::atomic<bool>& stop);

    /**
     * One control cycle.
     * @return false if the cycle failed (no telemetry, actuation error)
     */
    bool run_cycle(double elapsed_s = 0.0);

    const control::ControlState& state() const { return state_; }
    const control::Decision& last_decision() const { return last_decision_; }
    const Stats& stats() const { return stats_; }

private:
    BalancerAppConfig cfg_;
    const control::DecisionEngine& engine_;
    power::TelemetrySource& telemetry_;
    power::LimitActuator& actuator_;
    utils::InfluxExporter* influx_;

    control::ControlState state_;
    control::Decision last_decision_;
    Stats stats_;
    CycleCsvWriter csv_;
};

} // namespace app
