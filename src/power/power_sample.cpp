// src/power/power_sample.cpp
#include "power/power_sample.hpp"

#include <cstring>

namespace power {

const char* to_string(PowerSourceId id) {
    switch (id) {
        case PowerSourceId::Phone:    return "phone";
        case PowerSourceId::Keyboard: return "keyboard";
    }
    return "?";
}

const char* to_string(ChargeStatus status) {
    switch (status) {
        case ChargeStatus::Charging:    return "Charging";
        case ChargeStatus::Discharging: return "Discharging";
        case ChargeStatus::NotCharging: return "NotCharging";
        case ChargeStatus::Full:        return "Full";
        case ChargeStatus::Unknown:     return "Unknown";
    }
    return "Unknown";
}

ChargeStatus parse_charge_status(const char* text) {
    if (!text) return ChargeStatus::Unknown;
    if (std::strcmp(text, "Charging") == 0) return ChargeStatus::Charging;
    if (std::strcmp(text, "Discharging") == 0) return ChargeStatus::Discharging;
    // sysfs spells it with a space, our own logs and CSV files without
    if (std::strcmp(text, "Not charging") == 0 ||
        std::strcmp(text, "NotCharging") == 0) return ChargeStatus::NotCharging;
    if (std::strcmp(text, "Full") == 0) return ChargeStatus::Full;
    return ChargeStatus::Unknown;
}

} // namespace power
