// src/power/sysfs_telemetry.hpp
#pragma once

#include <string>

#include "power/platform.hpp"
#include "power/telemetry_source.hpp"

namespace power {

/**
 * SysfsTelemetry - Reads both batteries from /sys/class/power_supply.
 *
 * Kernel units are µV and µA; samples carry mV and mA. The keyboard's
 * capacity attribute is missing on cases without a fuel gauge, which
 * simply leaves capacity_pct unknown.
 */
class SysfsTelemetry : public TelemetrySource {
public:
    SysfsTelemetry(PlatformProfile profile, std::string sysfs_root = "/sys");

    PowerSourceSample read(PowerSourceId id) override;

    const char* name() const override { return "sysfs"; }

private:
    PowerSourceSample read_node(PowerSourceId id,
                                const std::string& battery_dir,
                                const std::string& limit_path) const;

    PlatformProfile profile_;
    std::string root_;
};

} // namespace power
