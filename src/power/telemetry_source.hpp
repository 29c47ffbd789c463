// src/power/telemetry_source.hpp
#pragma once

#include "power/power_sample.hpp"

namespace power {

/**
 * TelemetrySource - Produces one PowerSourceSample per source per cycle.
 *
 * Implementations never throw: fields that cannot be read are left
 * unknown in the returned sample. Reads are bounded in time; retries,
 * if any, belong to the implementation.
 */
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    virtual PowerSourceSample read(PowerSourceId id) = 0;

    /**
     * Called once at the end of every control cycle. Sources that replay
     * or simulate data use it to move to the next cycle.
     */
    virtual void advance() {}

    /**
     * True when a finite source has nothing more to deliver.
     */
    virtual bool finished() const { return false; }

    virtual const char* name() const = 0;
};

} // namespace power
