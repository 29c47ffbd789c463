// src/power/sysfs_actuator.hpp
#pragma once

#include <string>

#include "power/limit_actuator.hpp"
#include "power/platform.hpp"

namespace power {

/**
 * SysfsLimitActuator - Writes current limits to the charger drivers.
 *
 * Phone: input_current_limit, quantized to the platform step list.
 * Keyboard: the ip5xxx constant_charge_current, clamped to
 * [0, keyboard_budget_mA] and rounded down to 100 mA.
 *
 * A write is skipped when the node already holds the value. After a
 * write the node is read back and the read-back value is reported.
 */
class SysfsLimitActuator : public LimitActuator {
public:
    SysfsLimitActuator(PlatformProfile profile, int keyboard_budget_mA,
                       std::string sysfs_root = "/sys");

    bool apply(PowerSourceId id, int requested_mA, int& applied_mA) override;

    const char* name() const override { return "sysfs"; }

    // Value that would be written for a request, without touching sysfs
    int coerce(PowerSourceId id, int requested_mA) const;

private:
    std::string path_for(PowerSourceId id) const;

    PlatformProfile profile_;
    int keyboard_budget_mA_;
    std::string root_;
};

} // namespace power
