// src/control/engine_params.hpp
#pragma once

#include "power/limit_steps.hpp"

namespace control {

/**
 * Values outside these bounds are treated as unknown for that field.
 */
struct PlausibilityLimits {
    int min_voltage_mV = 2500;
    int max_voltage_mV = 4700;
    int max_abs_current_mA = 6000;
    int max_limit_mA = 5000;
};

struct DirectionParams {
    int hysteresis_cycles = 3;     // Contrary cycles needed to leave a guess
    int voltage_window = 5;        // Retained voltages (cycles)
    int voltage_trend_mV = 10;     // |newest - oldest| that counts as a trend
    int current_noise_mA = 20;     // |I| below this is "idle"
    int low_limit_mA = 1000;       // Limits at or below this count as "low"
    int near_limit_pct = 75;       // |I| >= this share of the limit is "at the limit"
};

struct EngineParams {
    // Platform
    power::LimitSteps steps;
    int default_limit_mA = 0;
    bool current_sign_unreliable = false;

    // Policy
    int critical_soc_pct = 20;
    int balance_margin_pct = 10;
    int light_load_mA = 400;
    int step_holdoff_cycles = 10;
    int keyboard_input_budget_mA = 2300;

    DirectionParams direction;
    PlausibilityLimits plausibility;
};

} // namespace control
