// src/power/sysfs_telemetry.cpp
#include "power/sysfs_telemetry.hpp"
#include "power/sysfs_io.hpp"
#include "utils/logging.hpp"

#include <utility>

namespace power {

namespace {

std::optional<int> read_micro(const std::string& path) {
    int64_t v = 0;
    if (!read_int64(path, v)) return std::nullopt;
    return static_cast<int>(v / 1000);
}

std::optional<int> read_plain(const std::string& path) {
    int64_t v = 0;
    if (!read_int64(path, v)) return std::nullopt;
    return static_cast<int>(v);
}

} // namespace

SysfsTelemetry::SysfsTelemetry(PlatformProfile profile, std::string sysfs_root)
    : profile_(std::move(profile)), root_(std::move(sysfs_root)) {}

PowerSourceSample SysfsTelemetry::read(PowerSourceId id) {
    const auto& layout = profile_.sysfs;
    if (id == PowerSourceId::Phone) {
        return read_node(id,
                         root_ + "/" + layout.phone_battery,
                         root_ + "/" + layout.phone_input + "/" + layout.phone_limit_attr);
    }
    const std::string kb = root_ + "/" + layout.keyboard_charger;
    return read_node(id, kb, kb + "/" + layout.keyboard_limit_attr);
}

PowerSourceSample SysfsTelemetry::read_node(PowerSourceId id,
                                            const std::string& battery_dir,
                                            const std::string& limit_path) const {
    PowerSourceSample s = PowerSourceSample::unavailable(id);

    s.voltage_mV = read_micro(battery_dir + "/voltage_now");
    s.current_mA = read_micro(battery_dir + "/current_now");
    s.capacity_pct = read_plain(battery_dir + "/capacity");
    s.current_limit_mA = read_micro(limit_path);

    std::string status;
    if (read_trimmed(battery_dir + "/status", status)) {
        s.status = parse_charge_status(status.c_str());
        if (s.status == ChargeStatus::Unknown) {
            LOG_DEBUG("[SysfsTelemetry] %s: unrecognised status '%s'", to_string(id), status.c_str());
        }
    }

    if (s.all_unknown()) {
        LOG_WARN("[SysfsTelemetry] %s: no readable attributes under %s",
                 to_string(id), battery_dir.c_str());
    }
    return s;
}

} // namespace power
