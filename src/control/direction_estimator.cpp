// src/control/direction_estimator.cpp
#include "control/direction_estimator.hpp"
#include "utils/logging.hpp"

#include <cstdlib>

namespace control {

using power::ChargeStatus;
using Evidence = DirectionEstimator::Evidence;

namespace {

bool is_discharge(Evidence e) {
    return e == Evidence::WeakDischarging || e == Evidence::StrongDischarging;
}

bool is_charge(Evidence e) {
    return e == Evidence::WeakCharging || e == Evidence::StrongCharging;
}

} // namespace

const char* to_string(Evidence e) {
    switch (e) {
        case Evidence::None:              return "none";
        case Evidence::WeakCharging:      return "weak-charging";
        case Evidence::StrongCharging:    return "strong-charging";
        case Evidence::WeakDischarging:   return "weak-discharging";
        case Evidence::StrongDischarging: return "strong-discharging";
    }
    return "?";
}

Evidence DirectionEstimator::evidence(const power::PowerSourceSample& s,
                                      const std::deque<int>& window) const {
    if (s.status == ChargeStatus::Discharging) {
        return Evidence::StrongDischarging;
    }

    if (s.current_mA && s.current_limit_mA && *s.current_limit_mA > 0) {
        const int mag = std::abs(*s.current_mA);
        const int lim = *s.current_limit_mA;

        if (mag > lim + (lim >> 2)) {
            return Evidence::StrongDischarging;
        }

        const bool at_low_limit = lim <= params_.low_limit_mA &&
                                  mag * 100 >= lim * params_.near_limit_pct;
        const bool fell_since_last = window.size() >= 2 &&
                                     window.back() < window[window.size() - 2];
        if (at_low_limit && fell_since_last) {
            return Evidence::StrongDischarging;
        }
    }

    if (s.status == ChargeStatus::Full) {
        return Evidence::StrongCharging;
    }

    if (window.size() >= 2) {
        const int trend = window.back() - window.front();
        if (trend <= -params_.voltage_trend_mV) return Evidence::WeakDischarging;
        if (trend >= params_.voltage_trend_mV) return Evidence::WeakCharging;
    }

    return Evidence::None;
}

Direction DirectionEstimator::update(const power::PowerSourceSample& s, DirectionState& st) const {
    if (s.voltage_mV) {
        st.voltage_window.push_back(*s.voltage_mV);
        while (static_cast<int>(st.voltage_window.size()) > params_.voltage_window) {
            st.voltage_window.pop_front();
        }
    } else {
        // A trend never spans a gap in the readings
        st.voltage_window.clear();
    }

    const Evidence ev = evidence(s, st.voltage_window);
    const Direction before = st.guess;

    if (!s.voltage_mV && ev == Evidence::None) {
        // Only the voltage kept the guess alive on this hardware
        if (before != Direction::Unknown) {
            LOG_DEBUG("[Direction] %s -> unknown (voltage unavailable)", to_string(before));
        }
        st.guess = Direction::Unknown;
        st.contrary_cycles = 0;
        return st.guess;
    }

    switch (st.guess) {
        case Direction::Unknown:
        case Direction::Idle:
            if (is_discharge(ev)) {
                st.guess = Direction::Discharging;
            } else if (is_charge(ev)) {
                st.guess = Direction::Charging;
            }
            st.contrary_cycles = 0;
            break;

        case Direction::Charging:
            if (ev == Evidence::StrongDischarging) {
                st.guess = Direction::Discharging;
                st.contrary_cycles = 0;
            } else if (ev == Evidence::WeakDischarging) {
                if (++st.contrary_cycles >= params_.hysteresis_cycles) {
                    st.guess = Direction::Discharging;
                    st.contrary_cycles = 0;
                }
            } else {
                st.contrary_cycles = 0;
            }
            break;

        case Direction::Discharging:
            if (is_charge(ev)) {
                if (++st.contrary_cycles >= params_.hysteresis_cycles) {
                    st.guess = Direction::Charging;
                    st.contrary_cycles = 0;
                }
            } else {
                st.contrary_cycles = 0;
            }
            break;
    }

    if (st.guess != before && before != Direction::Unknown) {
        ++st.flips;
        LOG_DEBUG("[Direction] %s -> %s (%s)", to_string(before), to_string(st.guess), to_string(ev));
    }
    return st.guess;
}

} // namespace control
