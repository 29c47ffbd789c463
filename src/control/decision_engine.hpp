// src/control/decision_engine.hpp
#pragma once

#include <memory>
#include <optional>

#include "control/control_state.hpp"
#include "control/direction_estimator.hpp"
#include "control/engine_params.hpp"
#include "control/soc_estimator.hpp"
#include "power/power_sample.hpp"

namespace control {

struct Decision {
    Action action = Action::Pass;
    int target_limit_mA = 0;                 // Phone input limit to request

    // Keyboard charge-current request, set only while the keyboard charges
    std::optional<int> keyboard_limit_mA;

    Direction phone_direction = Direction::Unknown;
    std::optional<int> keyboard_soc_pct;     // Gauge reading or estimate
    const char* reason = "";
};

struct DecisionResult {
    Decision decision;
    ControlState state;
};

/**
 * DecisionEngine - Picks the phone input current limit for one cycle.
 *
 * Rules, first match wins:
 *   1. Safety floor: phone SoC below critical_soc_pct -> Raise, or
 *      SetDefault holding the present limit once at/above the default
 *      and charging (or already at max). Never Lower or Pass.
 *   2. No clear signal (keyboard charger just (un)plugged, phone
 *      direction unresolved, keyboard telemetry missing, keyboard full)
 *      -> SetDefault, one step toward the platform default.
 *   3. Keyboard charging: share keyboard_input_budget_mA between the
 *      keyboard's own charger and the phone.
 *      Keyboard on battery: compare SoC (estimated for the keyboard when
 *      it has no gauge) and Raise/Lower by one step outside the margin;
 *      inside it, drift down toward the minimum under light load.
 *   4. Otherwise Pass.
 *
 * Every non-Pass target is at most one grid step from the limit in
 * effect. Balancing steps are additionally spaced step_holdoff_cycles
 * apart. With no telemetry at all the engine passes and leaves the
 * stored limit untouched.
 *
 * decide() has no side effects; the caller owns ControlState.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(EngineParams params,
                            std::unique_ptr<SocEstimator> keyboard_soc = nullptr);

    DecisionResult decide(const power::PowerSourceSample& phone,
                          const power::PowerSourceSample& keyboard,
                          const ControlState& state) const;

    // Clears implausible fields
    power::PowerSourceSample sanitize(const power::PowerSourceSample& s) const;

    const EngineParams& params() const { return params_; }

private:
    Direction phone_direction(const power::PowerSourceSample& phone, DirectionState& st) const;
    Direction direction_from_sign(const power::PowerSourceSample& s) const;

    void choose(Decision& d,
                const power::PowerSourceSample& phone,
                const power::PowerSourceSample& kb,
                int cur,
                const ControlState& prev,
                ControlState& next) const;

    bool safety_floor(Decision& d, const power::PowerSourceSample& phone, int cur) const;
    void balance_on_keyboard_charger(Decision& d, const power::PowerSourceSample& kb, int cur) const;
    void balance_on_keyboard_battery(Decision& d,
                                     const power::PowerSourceSample& phone,
                                     const power::PowerSourceSample& kb,
                                     int cur) const;

    void set(Decision& d, Action a, int target, const char* reason) const;
    void set_default(Decision& d, int cur, const char* reason) const;

    EngineParams params_;
    DirectionEstimator estimator_;
    std::unique_ptr<SocEstimator> keyboard_soc_;
};

} // namespace control
