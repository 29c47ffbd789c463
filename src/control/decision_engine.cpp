// src/control/decision_engine.cpp
#include "control/decision_engine.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace control {

using power::ChargeStatus;
using power::PowerSourceSample;

DecisionEngine::DecisionEngine(EngineParams params, std::unique_ptr<SocEstimator> keyboard_soc)
    : params_(std::move(params)),
      estimator_(params_.direction),
      keyboard_soc_(std::move(keyboard_soc)) {
    if (!keyboard_soc_) {
        keyboard_soc_ = std::make_unique<VoltageSocEstimator>();
    }
}

PowerSourceSample DecisionEngine::sanitize(const PowerSourceSample& in) const {
    const auto& lim = params_.plausibility;
    PowerSourceSample s = in;

    if (s.voltage_mV && (*s.voltage_mV < lim.min_voltage_mV || *s.voltage_mV > lim.max_voltage_mV)) {
        LOG_DEBUG("[Engine] %s: implausible voltage %d mV", power::to_string(s.id), *s.voltage_mV);
        s.voltage_mV.reset();
    }
    if (s.current_mA && std::abs(*s.current_mA) > lim.max_abs_current_mA) {
        LOG_DEBUG("[Engine] %s: implausible current %d mA", power::to_string(s.id), *s.current_mA);
        s.current_mA.reset();
    }
    if (s.capacity_pct && (*s.capacity_pct < 0 || *s.capacity_pct > 100)) {
        LOG_DEBUG("[Engine] %s: implausible capacity %d%%", power::to_string(s.id), *s.capacity_pct);
        s.capacity_pct.reset();
    }
    if (s.current_limit_mA && (*s.current_limit_mA < 0 || *s.current_limit_mA > lim.max_limit_mA)) {
        LOG_DEBUG("[Engine] %s: implausible limit %d mA", power::to_string(s.id), *s.current_limit_mA);
        s.current_limit_mA.reset();
    }
    return s;
}

Direction DecisionEngine::direction_from_sign(const PowerSourceSample& s) const {
    const int noise = params_.direction.current_noise_mA;

    if (s.status == ChargeStatus::Full) return Direction::Charging;
    if (!s.current_mA) return Direction::Unknown;

    const int i = *s.current_mA;
    // Status and sign contradict each other: trust neither
    if (s.status == ChargeStatus::Discharging && i > noise) return Direction::Unknown;

    if (i < -noise) return Direction::Discharging;
    if (i > noise) return Direction::Charging;
    return Direction::Idle;
}

Direction DecisionEngine::phone_direction(const PowerSourceSample& phone, DirectionState& st) const {
    if (params_.current_sign_unreliable) {
        return estimator_.update(phone, st);
    }

    if (phone.voltage_mV) {
        st.voltage_window.push_back(*phone.voltage_mV);
        while (static_cast<int>(st.voltage_window.size()) > params_.direction.voltage_window) {
            st.voltage_window.pop_front();
        }
    } else {
        st.voltage_window.clear();
    }
    const Direction d = direction_from_sign(phone);
    if (d != st.guess && st.guess != Direction::Unknown && d != Direction::Unknown) {
        ++st.flips;
    }
    st.guess = d;
    st.contrary_cycles = 0;
    return d;
}

void DecisionEngine::set(Decision& d, Action a, int target, const char* reason) const {
    d.action = a;
    d.target_limit_mA = target;
    d.reason = reason;
}

void DecisionEngine::set_default(Decision& d, int cur, const char* reason) const {
    set(d, Action::SetDefault, params_.steps.step_toward(cur, params_.default_limit_mA), reason);
}

bool DecisionEngine::safety_floor(Decision& d, const PowerSourceSample& phone, int cur) const {
    if (!phone.capacity_pct || *phone.capacity_pct >= params_.critical_soc_pct) {
        return false;
    }

    const auto& steps = params_.steps;
    const bool charging_enough = d.phone_direction == Direction::Charging &&
                                 cur >= params_.default_limit_mA;

    if (cur < steps.max() && !charging_enough) {
        set(d, Action::Raise, steps.step_up(cur), "phone below critical charge");
    } else {
        // Already at/above the default and charging, or at max: hold
        set(d, Action::SetDefault, cur, "phone below critical charge, holding");
    }
    return true;
}

void DecisionEngine::balance_on_keyboard_charger(Decision& d, const PowerSourceSample& kb, int cur) const {
    if (!kb.current_mA) {
        set_default(d, cur, "keyboard current unknown");
        return;
    }

    const int budget = params_.keyboard_input_budget_mA;
    const int cap = budget + (budget >> 4);
    const int kb_mA = std::abs(*kb.current_mA);

    if (d.phone_direction == Direction::Discharging) {
        // Phone drains while the keyboard charges: shift budget to the phone
        set(d, Action::Raise, params_.steps.step_up(cur), "phone discharging on keyboard charger");
    } else if (kb_mA + cur >= cap) {
        set(d, Action::Lower, params_.steps.step_down(cur), "keyboard input budget exceeded");
    } else {
        set(d, Action::Pass, cur, "within keyboard input budget");
    }
}

void DecisionEngine::balance_on_keyboard_battery(Decision& d,
                                                 const PowerSourceSample& phone,
                                                 const PowerSourceSample& kb,
                                                 int cur) const {
    if (!phone.capacity_pct) {
        set_default(d, cur, "phone charge unknown");
        return;
    }
    if (!d.keyboard_soc_pct) {
        set_default(d, cur, "keyboard charge unknown");
        return;
    }

    const auto& steps = params_.steps;
    const int diff = *phone.capacity_pct - *d.keyboard_soc_pct;

    if (diff < -params_.balance_margin_pct) {
        set(d, Action::Raise, steps.step_up(cur), "phone behind keyboard");
        return;
    }
    if (diff > params_.balance_margin_pct) {
        set(d, Action::Lower, steps.step_down(cur), "phone ahead of keyboard");
        return;
    }

    const bool light_load = kb.current_mA && std::abs(*kb.current_mA) <= params_.light_load_mA;
    const bool fed_by_keyboard = d.phone_direction == Direction::Charging;

    if (light_load || fed_by_keyboard) {
        set(d, Action::Lower, steps.step_down(cur),
            fed_by_keyboard ? "balanced, keyboard charging phone" : "balanced, light load");
    } else {
        set(d, Action::Pass, cur, "balanced");
    }
}

void DecisionEngine::choose(Decision& d,
                            const PowerSourceSample& phone,
                            const PowerSourceSample& kb,
                            int cur,
                            const ControlState& prev,
                            ControlState& next) const {
    bool kb_switched = false;
    if (kb.status != ChargeStatus::Unknown) {
        const bool charging = kb.status == ChargeStatus::Charging;
        kb_switched = charging != prev.keyboard_charging;
        next.keyboard_charging = charging;
    }

    if (safety_floor(d, phone, cur)) {
        return;
    }

    if (kb_switched) {
        set_default(d, cur, next.keyboard_charging ? "keyboard charger connected"
                                                   : "keyboard charger removed");
        return;
    }

    if (d.phone_direction == Direction::Unknown) {
        set_default(d, cur, "phone direction unresolved");
        return;
    }

    switch (kb.status) {
        case ChargeStatus::Unknown:
            set_default(d, cur, "keyboard telemetry unavailable");
            return;
        case ChargeStatus::Full:
        case ChargeStatus::NotCharging:
            set_default(d, cur, "keyboard full");
            return;
        case ChargeStatus::Charging:
            balance_on_keyboard_charger(d, kb, cur);
            break;
        case ChargeStatus::Discharging:
            balance_on_keyboard_battery(d, phone, kb, cur);
            break;
    }

    // Steps that would not move the limit are no-ops
    if ((d.action == Action::Raise || d.action == Action::Lower) && d.target_limit_mA == cur) {
        set(d, Action::Pass, cur, d.action == Action::Raise ? "at maximum limit" : "at minimum limit");
        return;
    }

    if ((d.action == Action::Raise || d.action == Action::Lower) && prev.last_step_cycle &&
        next.cycle - *prev.last_step_cycle < static_cast<uint64_t>(params_.step_holdoff_cycles)) {
        set(d, Action::Pass, cur, "step hold-off");
    }
}

DecisionResult DecisionEngine::decide(const PowerSourceSample& phone_raw,
                                      const PowerSourceSample& kb_raw,
                                      const ControlState& prev) const {
    ControlState next = prev;
    next.cycle = prev.cycle + 1;

    const PowerSourceSample phone = sanitize(phone_raw);
    const PowerSourceSample kb = sanitize(kb_raw);

    // Limit in effect: read back, else what we asked for last, else default
    const int cur = phone.current_limit_mA.value_or(
        prev.last_limit_mA.value_or(params_.default_limit_mA));

    Decision d;
    d.target_limit_mA = cur;

    if (phone.all_unknown() && kb.all_unknown()) {
        d.action = Action::Pass;
        d.target_limit_mA = prev.last_limit_mA.value_or(cur);
        d.phone_direction = prev.phone_direction.guess;
        d.reason = "no telemetry";
        next.last_action = Action::Pass;
        return {d, next};
    }

    d.phone_direction = phone_direction(phone, next.phone_direction);
    d.keyboard_soc_pct = keyboard_soc_->estimate(kb);

    choose(d, phone, kb, cur, prev, next);

    if (next.keyboard_charging) {
        d.keyboard_limit_mA = std::max(0, params_.keyboard_input_budget_mA - d.target_limit_mA);
    }

    next.last_action = d.action;
    next.last_limit_mA = d.target_limit_mA;
    if (d.action != Action::Pass && d.target_limit_mA != cur) {
        next.last_step_cycle = next.cycle;
    }

    LOG_DEBUG("[Engine] cycle %llu: %s %d -> %d mA (%s), phone %s",
              static_cast<unsigned long long>(next.cycle), to_string(d.action), cur,
              d.target_limit_mA, d.reason, to_string(d.phone_direction));
    return {d, next};
}

} // namespace control
