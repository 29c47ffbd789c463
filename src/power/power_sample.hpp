// src/power/power_sample.hpp
#pragma once

#include <cstdint>
#include <optional>

namespace power {

enum class PowerSourceId : uint8_t {
    Phone = 0,
    Keyboard = 1
};

enum class ChargeStatus : uint8_t {
    Charging,
    Discharging,
    NotCharging,
    Full,
    Unknown
};

const char* to_string(PowerSourceId id);
const char* to_string(ChargeStatus status);

/**
 * Maps a power_supply "status" attribute ("Charging", "Not charging", ...)
 * to ChargeStatus. Anything unrecognised is Unknown.
 */
ChargeStatus parse_charge_status(const char* text);

/**
 * PowerSourceSample - One cycle's telemetry snapshot for one battery.
 *
 * Every field is optional: a value the driver could not deliver (or one
 * that failed plausibility checks) is left empty rather than guessed.
 * Sign convention for current_mA: negative = discharging.
 */
struct PowerSourceSample {
    PowerSourceId id = PowerSourceId::Phone;

    std::optional<int> voltage_mV;
    std::optional<int> current_mA;
    ChargeStatus status = ChargeStatus::Unknown;
    std::optional<int> capacity_pct;       // No fuel gauge on most keyboards
    std::optional<int> current_limit_mA;   // Read back from the charging path

    // True when nothing at all is known about this source
    bool all_unknown() const {
        return !voltage_mV && !current_mA && !capacity_pct && !current_limit_mA &&
               status == ChargeStatus::Unknown;
    }

    static PowerSourceSample unavailable(PowerSourceId id) {
        PowerSourceSample s;
        s.id = id;
        return s;
    }
};

} // namespace power
