// src/control/control_state.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <optional>

namespace control {

/**
 * Action - What the engine wants done to the phone's input current limit.
 * Pass leaves the limit untouched.
 */
enum class Action : uint8_t {
    Raise,
    Lower,
    SetDefault,
    Pass
};

enum class Direction : uint8_t {
    Unknown,
    Idle,         // |I| within the noise band (sign-reliable hardware only)
    Charging,
    Discharging
};

const char* to_string(Action a);
const char* to_string(Direction d);

/**
 * DirectionState - Sticky charge-direction guess for one battery.
 *
 * contrary_cycles counts consecutive cycles whose evidence contradicts
 * the current guess; voltage_window holds the most recent voltages,
 * oldest first.
 */
struct DirectionState {
    Direction guess = Direction::Unknown;
    int contrary_cycles = 0;
    uint32_t flips = 0;
    std::deque<int> voltage_window;
};

/**
 * ControlState - Everything the decision engine carries between cycles.
 *
 * Owned by the control loop and threaded through DecisionEngine::decide();
 * cycle N only ever sees the state produced by cycle N-1.
 */
struct ControlState {
    uint64_t cycle = 0;

    Action last_action = Action::Pass;
    std::optional<int> last_limit_mA;        // Last requested, or applied once confirmed
    std::optional<uint64_t> last_step_cycle; // Cycle of the last limit change

    DirectionState phone_direction;
    bool keyboard_charging = false;

    // Replace the requested limit with the value the actuator reports
    void record_applied(int applied_mA) { last_limit_mA = applied_mA; }
};

} // namespace control
