// src/control/direction_estimator.hpp
#pragma once

#include <deque>

#include "control/control_state.hpp"
#include "control/engine_params.hpp"
#include "power/power_sample.hpp"

namespace control {

/**
 * DirectionEstimator - Guesses the real charge direction of a battery
 * whose driver reports only |I| and a status stuck at "Charging".
 *
 * Each cycle yields one piece of evidence:
 *   strong discharge: |I| above 1.25x the input limit (the input alone
 *                     cannot deliver that), a reported Discharging status,
 *                     or |I| at a low limit while the voltage dropped
 *                     since the previous cycle
 *   weak discharge:   voltage fell by >= trend_mV across the window
 *   strong charge:    status Full
 *   weak charge:      voltage rose by >= trend_mV across the window
 *
 * The guess is sticky. From Unknown the first evidence is adopted.
 * Charging -> Discharging on one strong cycle or hysteresis_cycles weak
 * ones in a row; Discharging -> Charging only after hysteresis_cycles
 * consecutive charge cycles. Anything else resets the counter.
 *
 * An unknown voltage empties the window. If the sample then carries no
 * other evidence the guess drops back to Unknown.
 */
class DirectionEstimator {
public:
    enum class Evidence {
        None,
        WeakCharging,
        StrongCharging,
        WeakDischarging,
        StrongDischarging
    };

    explicit DirectionEstimator(const DirectionParams& params = {}) : params_(params) {}

    /**
     * Feed one sample, update the state, return the new guess.
     */
    Direction update(const power::PowerSourceSample& s, DirectionState& st) const;

    /**
     * Evidence carried by a sample given the voltage window that already
     * includes the sample's own voltage.
     */
    Evidence evidence(const power::PowerSourceSample& s, const std::deque<int>& window) const;

    const DirectionParams& params() const { return params_; }

private:
    DirectionParams params_;
};

const char* to_string(DirectionEstimator::Evidence e);

} // namespace control
