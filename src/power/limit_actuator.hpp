// src/power/limit_actuator.hpp
#pragma once

#include "power/power_sample.hpp"

namespace power {

/**
 * LimitActuator - Applies an input/charge current limit to hardware.
 *
 * The hardware only accepts discrete values, so the actuator owns
 * quantization and reports what is actually in effect afterwards.
 */
class LimitActuator {
public:
    virtual ~LimitActuator() = default;

    /**
     * Apply a current limit.
     *
     * @param id Which charging path (Phone input limit, Keyboard charge limit)
     * @param requested_mA Limit the decision engine asked for
     * @param applied_mA Out: limit in effect afterwards (authoritative)
     * @return false on actuation failure; applied_mA is then untouched
     */
    virtual bool apply(PowerSourceId id, int requested_mA, int& applied_mA) = 0;

    virtual const char* name() const = 0;
};

} // namespace power
