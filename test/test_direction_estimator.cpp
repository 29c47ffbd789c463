// test/test_direction_estimator.cpp
/**
 * Unit Test: DirectionEstimator
 *
 * Charge direction on hardware that reports |I| and a status stuck at
 * "Charging".
 *
 * Test Coverage:
 *   1. First evidence is adopted from Unknown
 *   2. Strong discharge evidence flips Charging immediately
 *   3. Weak discharge evidence needs hysteresis_cycles in a row
 *   4. Leaving Discharging needs hysteresis_cycles charge cycles in a row
 *   5. Alternating ambiguous signals do not chatter
 *   6. An unknown voltage ends voltage-based evidence
 */

#include "control/direction_estimator.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_RESET  "\033[0m"

using control::Direction;
using control::DirectionEstimator;
using control::DirectionState;
using power::ChargeStatus;
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

// axp20x style sample: status always Charging, current is a magnitude
static PowerSourceSample phone(int mV, int mA = 100, int limit_mA = 500,
                               ChargeStatus status = ChargeStatus::Charging) {
    PowerSourceSample s;
    s.id = power::PowerSourceId::Phone;
    s.voltage_mV = mV;
    s.current_mA = mA;
    s.current_limit_mA = limit_mA;
    s.status = status;
    return s;
}

void test_adopt_first_evidence(TestResult& r) {
    std::cout << "\n=== Test 1: Adopt first evidence ===\n";
    DirectionEstimator est;
    DirectionState st;

    r.check(est.update(phone(3800), st) == Direction::Unknown, "Single voltage gives no evidence");
    r.check(est.update(phone(3780), st) == Direction::Discharging, "Falling voltage adopted as Discharging");
    r.check(st.flips == 0, "Leaving Unknown is not a flip");

    DirectionState st2;
    est.update(phone(3800), st2);
    r.check(est.update(phone(3820), st2) == Direction::Charging, "Rising voltage adopted as Charging");
}

void test_strong_discharge(TestResult& r) {
    std::cout << "\n=== Test 2: Strong discharge evidence ===\n";
    DirectionEstimator est;

    {
        DirectionState st;
        st.guess = Direction::Charging;
        // 700 mA through a 500 mA input limit: the battery must supply it
        r.check(est.update(phone(3800, 700, 500), st) == Direction::Discharging,
                "|I| above 1.25x limit flips at once");
        r.check(st.flips == 1, "Flip counted");
    }
    {
        DirectionState st;
        st.guess = Direction::Charging;
        r.check(est.update(phone(3800, 100, 500, ChargeStatus::Discharging), st) == Direction::Discharging,
                "Reported Discharging flips at once");
    }
    {
        DirectionState st;
        st.guess = Direction::Charging;
        est.update(phone(3805, 420, 500), st);
        r.check(est.update(phone(3800, 420, 500), st) == Direction::Discharging,
                "Pinned at a low limit with voltage falling flips at once");
    }
    {
        DirectionState st;
        st.guess = Direction::Charging;
        est.update(phone(3805, 420, 1500), st);
        r.check(est.update(phone(3800, 420, 1500), st) == Direction::Charging,
                "Same current under a high limit is not strong evidence");
    }
}

void test_weak_discharge_hysteresis(TestResult& r) {
    std::cout << "\n=== Test 3: Weak discharge needs hysteresis ===\n";
    DirectionEstimator est;  // hysteresis 3, window 5, trend 10
    DirectionState st;
    st.guess = Direction::Charging;

    est.update(phone(3900, 50, 2000), st);
    r.check(est.update(phone(3890, 50, 2000), st) == Direction::Charging, "1st falling cycle holds");
    r.check(est.update(phone(3880, 50, 2000), st) == Direction::Charging, "2nd falling cycle holds");
    r.check(est.update(phone(3870, 50, 2000), st) == Direction::Discharging, "3rd falling cycle flips");
}

void test_leave_discharging(TestResult& r) {
    std::cout << "\n=== Test 4: Leaving Discharging ===\n";
    DirectionEstimator est;
    DirectionState st;
    st.guess = Direction::Discharging;

    auto full = [](int mV) {
        PowerSourceSample s = phone(mV, 0, 500, ChargeStatus::Full);
        return s;
    };

    r.check(est.update(full(4150), st) == Direction::Discharging, "1 charge cycle holds");
    r.check(est.update(full(4150), st) == Direction::Discharging, "2 charge cycles hold");
    r.check(est.update(phone(4150, 100, 2000), st) == Direction::Discharging, "Neutral cycle holds");
    r.check(st.contrary_cycles == 0, "Neutral cycle resets the counter");
    est.update(full(4150), st);
    est.update(full(4150), st);
    r.check(est.update(full(4150), st) == Direction::Charging, "3 consecutive charge cycles flip");
}

void test_alternating_signals(TestResult& r) {
    std::cout << "\n=== Test 5: Alternating signals ===\n";
    control::DirectionParams p;
    p.voltage_window = 2;
    p.hysteresis_cycles = 3;
    DirectionEstimator est(p);
    DirectionState st;

    const int cycles = 60;
    for (int i = 0; i < cycles; ++i) {
        // Every cycle contradicts the previous one
        est.update(phone(i % 2 == 0 ? 3800 : 3830, 100, 2000), st);
    }
    r.check(st.flips <= static_cast<uint32_t>(cycles / p.hysteresis_cycles),
            "At most one flip per hysteresis window (" + std::to_string(st.flips) + " flips)");
    r.check(st.guess != Direction::Unknown, "A direction was settled");
}

void test_voltage_dropout(TestResult& r) {
    std::cout << "\n=== Test 6: Voltage reading drops out ===\n";
    DirectionEstimator est;
    DirectionState st;

    for (int mV = 3900; mV >= 3860; mV -= 10) {
        est.update(phone(mV, 100, 2000), st);
    }
    r.check(st.guess == Direction::Discharging, "Falling trend settles on Discharging");

    PowerSourceSample blind = phone(0, 100, 2000);
    blind.voltage_mV.reset();

    int resolved = 0;
    int with_evidence = 0;
    for (int i = 0; i < 100; ++i) {
        if (est.update(blind, st) != Direction::Unknown) ++resolved;
        if (est.evidence(blind, st.voltage_window) != DirectionEstimator::Evidence::None) ++with_evidence;
    }
    r.check(resolved == 0, "Direction unresolved while the voltage is unknown");
    r.check(with_evidence == 0, "No trend evidence from readings before the gap");
    r.check(st.voltage_window.empty(), "Window emptied by the gap");

    r.check(est.update(phone(3850, 100, 2000), st) == Direction::Unknown, "One fresh reading is not a trend");
    r.check(est.update(phone(3830, 100, 2000), st) == Direction::Discharging, "Fresh falling trend adopted");

    PowerSourceSample reported = blind;
    reported.status = ChargeStatus::Discharging;
    DirectionState st2;
    r.check(est.update(reported, st2) == Direction::Discharging,
            "Reported Discharging still counts without a voltage");
}

int main() {
    utils::set_level(utils::LogLevel::Warn);

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            DirectionEstimator Unit Tests                     ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_adopt_first_evidence(result);
    test_strong_discharge(result);
    test_weak_discharge_hysteresis(result);
    test_leave_discharging(result);
    test_alternating_signals(result);
    test_voltage_dropout(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
