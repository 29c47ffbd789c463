// src/sim/lua_scenario.cpp
#include "lua_scenario.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace sim {

using power::PowerSourceId;
using power::PowerSourceSample;

static const char* source_key(PowerSourceId id) {
    return id == PowerSourceId::Phone ? "phone" : "keyboard";
}

LuaScenario::LuaScenario(power::LimitSteps steps) : steps_(std::move(steps)) {}

LuaScenario::~LuaScenario() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaScenario::init(const std::string& lua_script_path) {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    lua_getglobal(L_, "scenario_sample");
    const bool has_sample = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_sample) {
        LOG_ERROR("[Lua] scenario_sample() missing in %s", lua_script_path.c_str());
        return false;
    }

    // Optional scenario_init()
    lua_getglobal(L_, "scenario_init");
    if (lua_isfunction(L_, -1)) {
        if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            return false;
        }
        const bool ok = lua_isnil(L_, -1) || lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_ERROR("[Lua] scenario_init returned false");
            return false;
        }
    } else {
        lua_pop(L_, 1);
    }

    cycle_ = 0;
    limits_.clear();
    LOG_INFO("[Lua] Scenario loaded: %s", lua_script_path.c_str());
    return true;
}

bool LuaScenario::read_sample_table_(int idx, PowerSourceSample& out) const {
    idx = lua_absindex(L_, idx);
    if (!lua_istable(L_, idx)) return false;

    auto get_int = [&](const char* k) -> std::optional<int> {
        lua_getfield(L_, idx, k);
        std::optional<int> v;
        if (lua_isnumber(L_, -1)) v = static_cast<int>(lua_tointeger(L_, -1));
        lua_pop(L_, 1);
        return v;
    };

    out.voltage_mV = get_int("voltage_mv");
    out.current_mA = get_int("current_ma");
    out.capacity_pct = get_int("capacity_pct");
    out.current_limit_mA = get_int("limit_ma");

    lua_getfield(L_, idx, "status");
    if (lua_isstring(L_, -1)) {
        out.status = power::parse_charge_status(lua_tostring(L_, -1));
    }
    lua_pop(L_, 1);

    return true;
}

PowerSourceSample LuaScenario::read(PowerSourceId id) {
    PowerSourceSample s = PowerSourceSample::unavailable(id);
    if (!L_) return s;

    lua_getglobal(L_, "scenario_sample");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_sample() missing");
        return s;
    }

    lua_pushinteger(L_, static_cast<lua_Integer>(cycle_));
    lua_pushstring(L_, source_key(id));
    auto it = limits_.find(id);
    if (it != limits_.end()) {
        lua_pushinteger(L_, it->second);
    } else {
        lua_pushnil(L_);
    }

    if (lua_pcall(L_, 3, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_sample failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return s;
    }

    if (!read_sample_table_(-1, s)) {
        LOG_WARN("[Lua] scenario_sample(%llu, %s) returned no table",
                 static_cast<unsigned long long>(cycle_), source_key(id));
        s = PowerSourceSample::unavailable(id);
    }
    lua_pop(L_, 1);

    // The script may leave the limit to us: report what was last applied
    if (!s.current_limit_mA && it != limits_.end()) {
        s.current_limit_mA = it->second;
    }
    return s;
}

bool LuaScenario::finished() const {
    if (!L_) return true;

    lua_getglobal(L_, "scenario_done");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }

    lua_pushinteger(L_, static_cast<lua_Integer>(cycle_));
    if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_done failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return true;
    }
    const bool done = lua_toboolean(L_, -1);
    lua_pop(L_, 1);
    return done;
}

bool LuaScenario::apply(PowerSourceId id, int requested_mA, int& applied_mA) {
    if (!L_) return false;

    const int v = (id == PowerSourceId::Phone) ? steps_.quantize(requested_mA)
                                               : std::max(0, requested_mA);

    // Optional scenario_apply(source, limit_ma) can veto (fault injection)
    lua_getglobal(L_, "scenario_apply");
    if (lua_isfunction(L_, -1)) {
        lua_pushstring(L_, source_key(id));
        lua_pushinteger(L_, v);
        if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
            LOG_ERROR("[Lua] scenario_apply failed: %s", lua_tostring(L_, -1));
            lua_pop(L_, 1);
            return false;
        }
        const bool ok = lua_isnil(L_, -1) || lua_toboolean(L_, -1);
        lua_pop(L_, 1);
        if (!ok) {
            LOG_WARN("[Lua] scenario_apply(%s, %d) rejected", source_key(id), v);
            return false;
        }
    } else {
        lua_pop(L_, 1);
    }

    limits_[id] = v;
    applied_mA = v;
    return true;
}

} // namespace sim
