// src/app/balancer_app.cpp
#include "app/balancer_app.hpp"
#include "app/cycle_timer.hpp"
#include "utils/logging.hpp"

#include <utility>

namespace app {

using power::PowerSourceId;

BalancerApp::BalancerApp(BalancerAppConfig cfg,
                         const control::DecisionEngine& engine,
                         power::TelemetrySource& telemetry,
                         power::LimitActuator& actuator,
                         utils::InfluxExporter* influx)
    : cfg_(std::move(cfg)),
      engine_(engine),
      telemetry_(telemetry),
      actuator_(actuator),
      influx_(influx) {
    if (!cfg_.csv_log_path.empty()) {
        csv_.open(cfg_.csv_log_path);
    }
}

bool BalancerApp::run_cycle(double elapsed_s) {
    const auto phone = telemetry_.read(PowerSourceId::Phone);
    const auto kb = telemetry_.read(PowerSourceId::Keyboard);

    auto result = engine_.decide(phone, kb, state_);
    state_ = std::move(result.state);
    const control::Decision& d = result.decision;
    last_decision_ = d;
    const unsigned long long cycle = state_.cycle;

    LOG_INFO("%s", format_cycle_line(phone, kb, d).c_str());

    bool ok = true;

    if (phone.all_unknown() && kb.all_unknown()) {
        LOG_ERROR("[Cycle %llu] No telemetry from either battery", cycle);
        ok = false;
    }

    if (d.action != control::Action::Pass) {
        int applied = 0;
        if (actuator_.apply(PowerSourceId::Phone, d.target_limit_mA, applied)) {
            state_.record_applied(applied);
            stats_.phone_writes++;
            if (applied != d.target_limit_mA) {
                LOG_DEBUG("[Cycle %llu] Phone limit %d mA requested, %d mA in effect",
                          cycle, d.target_limit_mA, applied);
            }
        } else {
            LOG_ERROR("[Cycle %llu] Failed to apply phone limit %d mA via %s",
                      cycle, d.target_limit_mA, actuator_.name());
            ok = false;
        }
    }

    if (d.keyboard_limit_mA &&
        (!kb.current_limit_mA || *kb.current_limit_mA != *d.keyboard_limit_mA)) {
        int applied = 0;
        if (actuator_.apply(PowerSourceId::Keyboard, *d.keyboard_limit_mA, applied)) {
            stats_.keyboard_writes++;
        } else {
            LOG_ERROR("[Cycle %llu] Failed to apply keyboard charge limit %d mA via %s",
                      cycle, *d.keyboard_limit_mA, actuator_.name());
            ok = false;
        }
    }

    csv_.write(state_.cycle, phone, kb, d);
    if (influx_) {
        influx_->write_cycle(phone, kb, d, state_.cycle, elapsed_s);
    }

    telemetry_.advance();

    stats_.cycles++;
    if (!ok) {
        stats_.failed_cycles++;
    }
    return ok;
}

int BalancerApp::run(const std::atomic<bool>& stop) {
    CycleTimer timer(cfg_.interval_s);

    LOG_INFO("[Balancer] Starting: telemetry=%s actuator=%s interval=%.2fs",
             telemetry_.name(), actuator_.name(), cfg_.interval_s);

    int exit_code = kExitOk;
    int consecutive_failures = 0;

    while (!stop.load()) {
        if (cfg_.max_cycles > 0 && stats_.cycles >= cfg_.max_cycles) {
            LOG_INFO("[Balancer] Reached %llu cycles",
                     static_cast<unsigned long long>(cfg_.max_cycles));
            break;
        }
        if (telemetry_.finished()) {
            LOG_INFO("[Balancer] Telemetry source %s finished", telemetry_.name());
            break;
        }

        timer.mark_loop_start();
        const bool ok = run_cycle(timer.get_elapsed_s());
        timer.update_loop_stats();

        if (ok) {
            consecutive_failures = 0;
        } else if (++consecutive_failures >= cfg_.max_consecutive_failures &&
                   cfg_.max_consecutive_failures > 0) {
            LOG_ERROR("[Balancer] %d consecutive failed cycles, giving up", consecutive_failures);
            exit_code = kExitTooManyFailures;
            break;
        }

        const bool on_time = timer.wait_for_next_cycle(stop);
        if (!on_time) {
            const auto& ts = timer.get_stats();
            LOG_WARN("[Balancer] Cycle overran its interval (misses: %zu, max lateness: %.1f ms)",
                     ts.deadline_misses, ts.max_lateness_ms);
        }
    }

    if (stop.load()) {
        LOG_INFO("[Balancer] Stop requested");
    }

    const auto& ts = timer.get_stats();
    LOG_INFO("========================================");
    LOG_INFO("Balancer Statistics");
    LOG_INFO("========================================");
    LOG_INFO("Cycles: %llu (%llu failed)",
             static_cast<unsigned long long>(stats_.cycles),
             static_cast<unsigned long long>(stats_.failed_cycles));
    LOG_INFO("Limit writes: phone %llu, keyboard %llu",
             static_cast<unsigned long long>(stats_.phone_writes),
             static_cast<unsigned long long>(stats_.keyboard_writes));
    LOG_INFO("Deadline misses: %zu, max loop time: %.1f ms", ts.deadline_misses, ts.max_loop_time_ms);
    if (state_.last_limit_mA) {
        LOG_INFO("Final phone limit: %d mA", *state_.last_limit_mA);
    }
    LOG_INFO("========================================");

    csv_.close();
    return exit_code;
}

} // namespace app
