// src/control/control_state.cpp
#include "control/control_state.hpp"

namespace control {

const char* to_string(Action a) {
    switch (a) {
        case Action::Raise:      return "Raise";
        case Action::Lower:      return "Lower";
        case Action::SetDefault: return "SetDefault";
        case Action::Pass:       return "Pass";
    }
    return "?";
}

const char* to_string(Direction d) {
    switch (d) {
        case Direction::Unknown:     return "unknown";
        case Direction::Idle:        return "idle";
        case Direction::Charging:    return "charging";
        case Direction::Discharging: return "discharging";
    }
    return "?";
}

} // namespace control
