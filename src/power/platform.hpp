// src/power/platform.hpp
#pragma once

#include <optional>
#include <string>

#include "power/limit_steps.hpp"

namespace power {

enum class Model {
    PinePhone,
    PinePhonePro
};

const char* to_string(Model model);

/**
 * Accepts "pinephone" and "pinephone-pro" (also "pinephonepro", "ppp").
 * "auto" is handled by the caller via detect_model().
 */
bool parse_model(const std::string& name, Model& out);

/**
 * Sysfs layout for one model, relative to the sysfs root (normally /sys).
 */
struct SysfsLayout {
    std::string phone_battery;     // voltage_now, current_now, status, capacity
    std::string phone_input;       // input_current_limit
    std::string phone_limit_attr = "input_current_limit";
    std::string keyboard_charger;  // ip5xxx charger node
    std::string keyboard_limit_attr = "constant_charge_current";
};

/**
 * PlatformProfile - Everything hardware specific the daemon needs.
 *
 * current_sign_unreliable: the charger driver reports |I| and keeps
 * reporting "Charging" while external power is present, even when the
 * battery is net discharging (axp20x on the original PinePhone).
 */
struct PlatformProfile {
    Model model = Model::PinePhone;
    LimitSteps steps;
    int default_limit_mA = 0;
    bool current_sign_unreliable = false;
    SysfsLayout sysfs;
};

PlatformProfile profile_for(Model model);

/**
 * Identify the board from the USB power supply node that exists under
 * <sysfs_root>/class/power_supply. Returns nullopt on unknown hardware.
 */
std::optional<Model> detect_model(const std::string& sysfs_root);

} // namespace power
