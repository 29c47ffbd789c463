// src/app/cycle_log.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <string>

#include "control/decision_engine.hpp"
#include "power/power_sample.hpp"

namespace app {

/**
 * One human-readable line per cycle:
 *   ph v: 3800, a: -300, s: Discharging, l: 500, c: 60, kb v: ..., act: Raise
 * Voltages in mV, currents in mA; unknown values print as n/a.
 */
std::string format_cycle_line(const power::PowerSourceSample& phone,
                              const power::PowerSourceSample& keyboard,
                              const control::Decision& decision);

/**
 * CycleCsvWriter - Per-cycle CSV log.
 *
 * One row per source per cycle, in the column layout ReplayTelemetry
 * reads, followed by the decision columns. A recorded run can therefore
 * be replayed directly.
 */
class CycleCsvWriter {
public:
    bool open(const std::string& path);
    bool is_open() const { return out_.is_open(); }

    void write(uint64_t cycle,
               const power::PowerSourceSample& phone,
               const power::PowerSourceSample& keyboard,
               const control::Decision& decision);

    void close();

private:
    void write_row_(uint64_t cycle, const power::PowerSourceSample& s,
                    const control::Decision& decision);

    std::ofstream out_;
};

} // namespace app
