// src/power/sysfs_actuator.cpp
#include "power/sysfs_actuator.hpp"
#include "power/sysfs_io.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <utility>

namespace power {

namespace {
constexpr int kKeyboardLimitGranularity_mA = 100;
}

SysfsLimitActuator::SysfsLimitActuator(PlatformProfile profile, int keyboard_budget_mA,
                                       std::string sysfs_root)
    : profile_(std::move(profile)),
      keyboard_budget_mA_(keyboard_budget_mA),
      root_(std::move(sysfs_root)) {}

std::string SysfsLimitActuator::path_for(PowerSourceId id) const {
    const auto& l = profile_.sysfs;
    if (id == PowerSourceId::Phone) {
        return root_ + "/" + l.phone_input + "/" + l.phone_limit_attr;
    }
    return root_ + "/" + l.keyboard_charger + "/" + l.keyboard_limit_attr;
}

int SysfsLimitActuator::coerce(PowerSourceId id, int requested_mA) const {
    if (id == PowerSourceId::Phone) {
        return profile_.steps.quantize(requested_mA);
    }
    const int clamped = std::max(0, std::min(requested_mA, keyboard_budget_mA_));
    return clamped - (clamped % kKeyboardLimitGranularity_mA);
}

bool SysfsLimitActuator::apply(PowerSourceId id, int requested_mA, int& applied_mA) {
    const std::string path = path_for(id);
    const int target = coerce(id, requested_mA);

    if (target != requested_mA) {
        LOG_DEBUG("[SysfsActuator] %s: %d mA coerced to %d mA", to_string(id), requested_mA, target);
    }

    int64_t current_uA = 0;
    if (read_int64(path, current_uA) && current_uA == static_cast<int64_t>(target) * 1000) {
        applied_mA = target;
        return true;
    }

    LOG_INFO("[SysfsActuator] setting %s limit: %d mA", to_string(id), target);
    if (!write_line(path, std::to_string(static_cast<int64_t>(target) * 1000))) {
        return false;
    }

    int64_t readback_uA = 0;
    if (!read_int64(path, readback_uA)) {
        LOG_WARN("[SysfsActuator] %s: read-back failed, assuming %d mA", to_string(id), target);
        applied_mA = target;
        return true;
    }

    applied_mA = static_cast<int>(readback_uA / 1000);
    if (applied_mA != target) {
        LOG_WARN("[SysfsActuator] %s: requested %d mA, driver holds %d mA",
                 to_string(id), target, applied_mA);
    }
    return true;
}

} // namespace power
