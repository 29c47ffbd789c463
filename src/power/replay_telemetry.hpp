// src/power/replay_telemetry.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "power/telemetry_source.hpp"

namespace power {

/**
 * ReplayTelemetry - Feeds recorded samples back, one cycle per advance().
 *
 * CSV columns: cycle, source (phone|keyboard), voltage_mv, current_ma,
 * status, capacity_pct, limit_ma. Empty or "n/a" cells are unknown.
 * A cycle without a row for a source yields an unavailable sample for it.
 *
 * Playback starts at the lowest recorded cycle number. Missing cycles in
 * between replay as unavailable, but a gap longer than kMaxGapCycles is
 * shortened to that length.
 */
class ReplayTelemetry : public TelemetrySource {
public:
    static constexpr uint64_t kMaxGapCycles = 3600;

    ReplayTelemetry() = default;

    bool load(const std::string& csv_path);

    PowerSourceSample read(PowerSourceId id) override;
    void advance() override { ++position_; }
    bool finished() const override { return position_ >= length_; }

    const char* name() const override { return "replay"; }

    uint64_t cycle_count() const { return length_; }

private:
    struct Cycle {
        PowerSourceSample phone = PowerSourceSample::unavailable(PowerSourceId::Phone);
        PowerSourceSample keyboard = PowerSourceSample::unavailable(PowerSourceId::Keyboard);
    };

    // Keyed by playback position; absent positions are gap cycles
    std::map<uint64_t, Cycle> cycles_;
    uint64_t length_ = 0;
    uint64_t position_ = 0;
};

} // namespace power
