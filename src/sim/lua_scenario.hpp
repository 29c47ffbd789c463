// src/sim/lua_scenario.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "power/limit_actuator.hpp"
#include "power/limit_steps.hpp"
#include "power/telemetry_source.hpp"

namespace sim {

/**
 * LuaScenario - Bench scenario that stands in for both batteries.
 *
 * The script provides:
 *   scenario_sample(cycle, source, limit_ma) -> table   (required)
 *       source is "phone" or "keyboard", limit_ma is the last applied
 *       limit for that path or nil. Returned table fields: voltage_mv,
 *       current_ma, status, capacity_pct, limit_ma (all optional).
 *   scenario_init() -> bool                              (optional)
 *   scenario_apply(source, limit_ma) -> bool             (optional)
 *   scenario_done(cycle) -> bool                         (optional)
 *
 * Applied limits are quantized like real hardware and fed back into the
 * next scenario_sample() call. A failing script call yields an unknown
 * sample for that cycle; it never throws.
 */
class LuaScenario : public power::TelemetrySource, public power::LimitActuator {
public:
    explicit LuaScenario(power::LimitSteps steps);
    ~LuaScenario() override;

    LuaScenario(const LuaScenario&) = delete;
    LuaScenario& operator=(const LuaScenario&) = delete;

    bool init(const std::string& lua_script_path);

    power::PowerSourceSample read(power::PowerSourceId id) override;
    void advance() override { ++cycle_; }
    bool finished() const override;

    bool apply(power::PowerSourceId id, int requested_mA, int& applied_mA) override;

    const char* name() const override { return "lua"; }

    uint64_t cycle() const { return cycle_; }

private:
    lua_State* L_{nullptr};
    power::LimitSteps steps_;
    uint64_t cycle_ = 0;
    std::map<power::PowerSourceId, int> limits_;

    bool read_sample_table_(int idx, power::PowerSourceSample& out) const;
};

} // namespace sim
