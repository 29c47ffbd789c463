// test/test_decision_engine.cpp
/**
 * Unit Test: DecisionEngine
 *
 * Test Coverage:
 *   1. Safety floor dominance over every keyboard state
 *   2. Rate limiting: at most one grid step per cycle
 *   3. Degraded input: no telemetry -> Pass, stored limit untouched
 *   4. Stable balanced input converges to Pass at a constant limit
 *   5. Field plausibility checks
 *   6. Keyboard charger handling and input budget
 *   7. Step hold-off
 *   8. Reference scenarios (critical phone, balanced at minimum,
 *      sign-unreliable phone with falling voltage)
 */

#include "control/decision_engine.hpp"
#include "power/platform.hpp"
#include "utils/logging.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_RESET  "\033[0m"

using control::Action;
using control::ControlState;
using control::DecisionEngine;
using control::Direction;
using control::EngineParams;
using power::ChargeStatus;
using power::PowerSourceId;
using power::PowerSourceSample;

struct TestResult {
    int passed = 0;
    int failed = 0;

    void check(bool ok, const std::string& msg) {
        if (ok) {
            std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
            ++passed;
        } else {
            std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
            ++failed;
        }
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// ============================================================================
// Helpers
// ============================================================================

static EngineParams params_for(power::Model model, int holdoff = 10) {
    const auto profile = power::profile_for(model);
    EngineParams p;
    p.steps = profile.steps;
    p.default_limit_mA = profile.default_limit_mA;
    p.current_sign_unreliable = profile.current_sign_unreliable;
    p.step_holdoff_cycles = holdoff;
    return p;
}

static PowerSourceSample make_phone(std::optional<int> cap, int mV, int mA, int limit,
                                    ChargeStatus status = ChargeStatus::Charging) {
    PowerSourceSample s;
    s.id = PowerSourceId::Phone;
    s.capacity_pct = cap;
    s.voltage_mV = mV;
    s.current_mA = mA;
    s.current_limit_mA = limit;
    s.status = status;
    return s;
}

static PowerSourceSample make_kb(std::optional<int> cap, int mV, int mA, ChargeStatus status,
                                 std::optional<int> limit = std::nullopt) {
    PowerSourceSample s;
    s.id = PowerSourceId::Keyboard;
    s.capacity_pct = cap;
    s.voltage_mV = mV;
    s.current_mA = mA;
    s.status = status;
    s.current_limit_mA = limit;
    return s;
}

// Small deterministic generator for property sweeps
struct Lcg {
    uint32_t state;
    explicit Lcg(uint32_t seed) : state(seed) {}
    int next(int lo, int hi) {
        state = state * 1664525u + 1013904223u;
        return lo + static_cast<int>((state >> 8) % static_cast<uint32_t>(hi - lo + 1));
    }
};

static const ChargeStatus kStatuses[] = {
    ChargeStatus::Charging, ChargeStatus::Discharging, ChargeStatus::NotCharging,
    ChargeStatus::Full, ChargeStatus::Unknown
};

// ============================================================================
// Tests
// ============================================================================

void test_safety_floor_dominance(TestResult& r) {
    std::cout << "\n=== Test 1: Safety floor dominance ===\n";

    for (auto model : {power::Model::PinePhone, power::Model::PinePhonePro}) {
        DecisionEngine engine(params_for(model));
        const auto& steps = power::profile_for(model).steps;
        Lcg rng(model == power::Model::PinePhone ? 7u : 11u);

        bool all_ok = true;
        for (int i = 0; i < 500; ++i) {
            ControlState st;
            st.keyboard_charging = rng.next(0, 1) == 1;
            st.last_step_cycle = static_cast<uint64_t>(rng.next(0, 2));
            st.cycle = 1;

            const int limit = steps.values()[static_cast<size_t>(rng.next(0, static_cast<int>(steps.size()) - 1))];
            auto phone = make_phone(rng.next(0, 19), rng.next(3300, 4200), rng.next(-1500, 1500), limit,
                                    kStatuses[rng.next(0, 4)]);
            auto kb = make_kb(rng.next(0, 1) ? std::optional<int>(rng.next(0, 100)) : std::nullopt,
                              rng.next(3300, 4200), rng.next(-2000, 2000), kStatuses[rng.next(0, 4)]);

            const auto d = engine.decide(phone, kb, st).decision;
            if (d.action != Action::Raise && d.action != Action::SetDefault) {
                all_ok = false;
                std::cout << "    got " << control::to_string(d.action) << " (" << d.reason << ")\n";
                break;
            }
        }
        r.check(all_ok, std::string("Critical phone never gets Lower/Pass on ") + power::to_string(model));
    }
}

void test_rate_limiting(TestResult& r) {
    std::cout << "\n=== Test 2: Rate limiting ===\n";

    for (auto model : {power::Model::PinePhone, power::Model::PinePhonePro}) {
        DecisionEngine engine(params_for(model, 0));
        const auto& steps = power::profile_for(model).steps;
        Lcg rng(42u);

        ControlState st;
        int limit = steps.min();
        bool all_ok = true;

        for (int i = 0; i < 1000; ++i) {
            auto phone = make_phone(rng.next(0, 100), rng.next(3300, 4200), rng.next(-1500, 1500), limit,
                                    kStatuses[rng.next(0, 4)]);
            auto kb = make_kb(std::nullopt, rng.next(3300, 4200), rng.next(-2000, 2000),
                              kStatuses[rng.next(0, 4)]);
            if (rng.next(0, 9) == 0) {
                phone = PowerSourceSample::unavailable(PowerSourceId::Phone);
            }

            auto res = engine.decide(phone, kb, st);
            const int target = res.decision.target_limit_mA;
            if (steps.distance(limit, target) > 1 || !steps.contains(target)) {
                all_ok = false;
                std::cout << "    " << limit << " -> " << target << " (" << res.decision.reason << ")\n";
                break;
            }
            st = res.state;
            if (res.decision.action != Action::Pass) {
                limit = target;
                st.record_applied(limit);
            }
        }
        r.check(all_ok, std::string("Every target within one step on ") + power::to_string(model));
    }
}

void test_degraded_input(TestResult& r) {
    std::cout << "\n=== Test 3: Degraded input ===\n";
    DecisionEngine engine(params_for(power::Model::PinePhonePro));
    const auto none_ph = PowerSourceSample::unavailable(PowerSourceId::Phone);
    const auto none_kb = PowerSourceSample::unavailable(PowerSourceId::Keyboard);

    ControlState st;
    st.last_limit_mA = 1250;
    auto res = engine.decide(none_ph, none_kb, st);
    r.check(res.decision.action == Action::Pass, "No telemetry -> Pass");
    r.check(res.state.last_limit_mA == 1250, "Stored limit unchanged");
    r.check(res.decision.target_limit_mA == 1250, "Target reports the stored limit");
    r.check(res.state.cycle == st.cycle + 1, "Cycle counter still advances");

    ControlState fresh;
    auto res2 = engine.decide(none_ph, none_kb, fresh);
    r.check(res2.decision.action == Action::Pass && !res2.state.last_limit_mA,
            "No stored limit stays unset");
}

void test_pass_converges(TestResult& r) {
    std::cout << "\n=== Test 4: Stable balanced input converges ===\n";
    DecisionEngine engine(params_for(power::Model::PinePhonePro, 0));

    ControlState st;
    int limit = 1500;
    std::vector<Action> actions;
    std::vector<int> targets;

    for (int i = 0; i < 20; ++i) {
        // Phone 60%, keyboard ~55% by voltage, moderate keyboard load
        auto phone = make_phone(60, 3850, 150, limit);
        auto kb = make_kb(std::nullopt, 3800, -600, ChargeStatus::Discharging);
        auto res = engine.decide(phone, kb, st);
        st = res.state;
        if (res.decision.action != Action::Pass) {
            limit = res.decision.target_limit_mA;
            st.record_applied(limit);
        }
        actions.push_back(res.decision.action);
        targets.push_back(res.decision.target_limit_mA);
    }

    bool stable = true;
    for (size_t i = 10; i < actions.size(); ++i) {
        stable = stable && actions[i] == Action::Pass && targets[i] == targets[10];
    }
    r.check(stable, "Last 10 cycles are Pass at a constant limit");
    r.check(targets.back() == 450, "Settled at the minimum step");
}

void test_plausibility(TestResult& r) {
    std::cout << "\n=== Test 5: Plausibility ===\n";
    DecisionEngine engine(params_for(power::Model::PinePhonePro, 0));
    ControlState st;

    // Negative capacity is unknown, not critical
    auto phone = make_phone(-5, 3850, 150, 850);
    auto kb = make_kb(std::nullopt, 3800, -600, ChargeStatus::Discharging);
    auto res = engine.decide(phone, kb, st);
    r.check(res.decision.action == Action::SetDefault, "Impossible capacity falls back to SetDefault");
    r.check(res.decision.target_limit_mA == 450, "SetDefault moves one step toward default");

    // Absurd limit read-back falls back to the stored limit
    ControlState st2;
    st2.last_limit_mA = 1000;
    auto phone2 = make_phone(60, 3850, 150, 90000);
    auto res2 = engine.decide(phone2, kb, st2);
    r.check(power::profile_for(power::Model::PinePhonePro).steps.distance(1000, res2.decision.target_limit_mA) <= 1,
            "Implausible limit replaced by stored limit");
}

void test_keyboard_charger(TestResult& r) {
    std::cout << "\n=== Test 6: Keyboard charger ===\n";
    DecisionEngine engine(params_for(power::Model::PinePhonePro));
    ControlState st;

    // Charger plugged in: forced SetDefault, budget split requested
    auto phone = make_phone(50, 3700, -200, 450, ChargeStatus::Discharging);
    auto kb = make_kb(std::nullopt, 4000, 800, ChargeStatus::Charging, 1000);
    auto res = engine.decide(phone, kb, st);
    r.check(res.decision.action == Action::SetDefault, "Charger connect -> SetDefault");
    r.check(res.state.keyboard_charging, "Keyboard charging remembered");
    r.check(res.decision.keyboard_limit_mA == 2300 - 450, "Keyboard gets budget minus phone limit");

    // Next cycle: phone still draining -> Raise, keyboard request shrinks
    auto res2 = engine.decide(phone, kb, res.state);
    r.check(res2.decision.action == Action::Raise && res2.decision.target_limit_mA == 850,
            "Discharging phone on keyboard charger -> Raise");
    r.check(res2.decision.keyboard_limit_mA == 2300 - 850, "Keyboard request follows the phone limit");

    // Budget exceeded
    ControlState st3;
    st3.keyboard_charging = true;
    auto phone3 = make_phone(50, 4000, 300, 1500, ChargeStatus::Charging);
    auto kb3 = make_kb(std::nullopt, 4100, 1200, ChargeStatus::Charging);
    auto res3 = engine.decide(phone3, kb3, st3);
    r.check(res3.decision.action == Action::Lower && res3.decision.target_limit_mA == 1250,
            "limit + keyboard current over budget -> Lower");

    // Charger removed
    auto kb4 = make_kb(std::nullopt, 4000, -300, ChargeStatus::Discharging);
    auto res4 = engine.decide(phone3, kb4, st3);
    r.check(res4.decision.action == Action::SetDefault && !res4.state.keyboard_charging,
            "Charger removal -> SetDefault");
    r.check(!res4.decision.keyboard_limit_mA, "No keyboard request on battery");
}

void test_holdoff(TestResult& r) {
    std::cout << "\n=== Test 7: Step hold-off ===\n";
    DecisionEngine engine(params_for(power::Model::PinePhonePro, 10));
    ControlState st;
    st.last_step_cycle = 0;
    st.cycle = 3;

    // Phone well behind keyboard
    auto phone = make_phone(30, 3700, -300, 450, ChargeStatus::Discharging);
    auto kb = make_kb(80, 3950, -500, ChargeStatus::Discharging);
    auto res = engine.decide(phone, kb, st);
    r.check(res.decision.action == Action::Pass, "Balancing step held off within 10 cycles");

    st.cycle = 10;
    auto res2 = engine.decide(phone, kb, st);
    r.check(res2.decision.action == Action::Raise && res2.decision.target_limit_mA == 850,
            "Balancing step allowed after hold-off");
    r.check(res2.state.last_step_cycle == res2.state.cycle, "Step cycle recorded");

    // Safety floor ignores hold-off
    auto critical = make_phone(10, 3500, -300, 450, ChargeStatus::Discharging);
    st.cycle = 1;
    auto res3 = engine.decide(critical, kb, st);
    r.check(res3.decision.action == Action::Raise, "Safety floor is never held off");
}

void test_reference_scenarios(TestResult& r) {
    std::cout << "\n=== Test 8: Reference scenarios ===\n";

    {
        // Critical phone, genuinely charging on sign-reliable hardware
        DecisionEngine engine(params_for(power::Model::PinePhonePro));
        auto phone = make_phone(15, 3750, 100, 450, ChargeStatus::Charging);
        auto kb = make_kb(std::nullopt, 3900, -300, ChargeStatus::Discharging);
        auto d = engine.decide(phone, kb, ControlState{}).decision;
        r.check(d.action == Action::Raise || d.action == Action::SetDefault,
                std::string("Phone at 15% -> ") + control::to_string(d.action));
    }

    {
        // Balanced at the minimum step under light load
        DecisionEngine engine(params_for(power::Model::PinePhonePro));
        auto phone = make_phone(60, 3850, 150, 450, ChargeStatus::Charging);
        auto kb = make_kb(std::nullopt, 3800, -300, ChargeStatus::Discharging);
        auto d = engine.decide(phone, kb, ControlState{}).decision;
        r.check(d.keyboard_soc_pct && *d.keyboard_soc_pct >= 50 && *d.keyboard_soc_pct <= 60,
                "Keyboard SoC estimated near 55% from voltage");
        r.check(d.action == Action::Pass, std::string("Balanced at minimum -> ") + control::to_string(d.action));
    }

    {
        // PinePhone: capacity unknown, +50 mA (magnitude only), voltage falling
        DecisionEngine engine(params_for(power::Model::PinePhone));
        ControlState st;
        control::Decision d;
        const int volts[] = {3800, 3790, 3780, 3770, 3760};
        for (int v : volts) {
            auto phone = make_phone(std::nullopt, v, 50, 500, ChargeStatus::Charging);
            auto kb = make_kb(std::nullopt, 3800, -300, ChargeStatus::Discharging);
            auto res = engine.decide(phone, kb, st);
            st = res.state;
            d = res.decision;
        }
        r.check(d.phone_direction == Direction::Discharging, "Direction inferred as Discharging");
        r.check(d.action != Action::Lower, std::string("Action is not Lower (") + control::to_string(d.action) + ")");
    }
}

int main() {
    utils::set_level(utils::LogLevel::Warn);

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            DecisionEngine Unit Tests                         ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_safety_floor_dominance(result);
    test_rate_limiting(result);
    test_degraded_input(result);
    test_pass_converges(result);
    test_plausibility(result);
    test_keyboard_charger(result);
    test_holdoff(result);
    test_reference_scenarios(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
