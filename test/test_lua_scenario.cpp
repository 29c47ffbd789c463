// test/test_lua_scenario.cpp
// Unit tests for the Lua bench scenario (telemetry + actuator)

#include "sim/lua_scenario.hpp"
#include "power/platform.hpp"
#include "utils/logging.hpp"
#include <fstream>
#include <iostream>
#include <string>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

using power::ChargeStatus;
using power::PowerSourceId;

static power::LimitSteps pinephone_steps() {
    return power::profile_for(power::Model::PinePhone).steps;
}

static std::string write_script(const std::string& name, const std::string& body) {
    const std::string path = "/tmp/" + name;
    std::ofstream f(path);
    f << body;
    return path;
}

// Phone drains faster the lower its input limit; keyboard errors on cycle 3
static const char* kScenario = R"(
function scenario_sample(cycle, source, limit_ma)
    if source == "phone" then
        local lim = limit_ma or 500
        return { voltage_mv = 3800 - cycle, current_ma = lim - 900,
                 status = "Discharging", capacity_pct = 50 }
    end
    if cycle == 3 then
        error("gauge offline")
    end
    return { voltage_mv = 3900, current_ma = -700, status = "Discharging" }
end

function scenario_apply(source, limit_ma)
    return not (source == "keyboard" and limit_ma > 2000)
end

function scenario_done(cycle)
    return cycle >= 5
end
)";

bool test_init_requires_sample_function() {
    sim::LuaScenario scn(pinephone_steps());
    const auto path = write_script("kbd_lua_empty.lua", "x = 1\n");
    TEST_ASSERT(!scn.init(path), "Script without scenario_sample rejected");

    sim::LuaScenario scn2(pinephone_steps());
    TEST_ASSERT(!scn2.init("/tmp/kbd_lua_does_not_exist.lua"), "Missing file rejected");

    sim::LuaScenario scn3(pinephone_steps());
    const auto refused = write_script("kbd_lua_refuse.lua",
        "function scenario_sample() return {} end\n"
        "function scenario_init() return false end\n");
    TEST_ASSERT(!scn3.init(refused), "scenario_init returning false fails init");
    return true;
}

bool test_read_fields() {
    sim::LuaScenario scn(pinephone_steps());
    TEST_ASSERT(scn.init(write_script("kbd_lua_scenario.lua", kScenario)), "Scenario loads");

    const auto phone = scn.read(PowerSourceId::Phone);
    TEST_ASSERT(phone.id == PowerSourceId::Phone, "Phone id");
    TEST_ASSERT(phone.voltage_mV && *phone.voltage_mV == 3800, "Voltage from script");
    TEST_ASSERT(phone.current_mA && *phone.current_mA == -400, "Current uses default limit");
    TEST_ASSERT(phone.status == ChargeStatus::Discharging, "Status parsed");
    TEST_ASSERT(phone.capacity_pct && *phone.capacity_pct == 50, "Capacity from script");
    TEST_ASSERT(!phone.current_limit_mA, "No limit before the first apply");

    const auto kb = scn.read(PowerSourceId::Keyboard);
    TEST_ASSERT(kb.id == PowerSourceId::Keyboard, "Keyboard id");
    TEST_ASSERT(!kb.capacity_pct, "Keyboard has no gauge");
    return true;
}

bool test_apply_feeds_back() {
    sim::LuaScenario scn(pinephone_steps());
    TEST_ASSERT(scn.init(write_script("kbd_lua_scenario.lua", kScenario)), "Scenario loads");

    int applied = 0;
    TEST_ASSERT(scn.apply(PowerSourceId::Phone, 950, applied), "Phone apply accepted");
    TEST_ASSERT(applied == 900, "Phone request quantized to the step list");

    scn.advance();
    const auto phone = scn.read(PowerSourceId::Phone);
    TEST_ASSERT(phone.current_limit_mA && *phone.current_limit_mA == 900, "Applied limit read back");
    TEST_ASSERT(phone.current_mA && *phone.current_mA == 0, "Script sees the applied limit");
    TEST_ASSERT(phone.voltage_mV && *phone.voltage_mV == 3799, "Cycle counter advanced");
    return true;
}

bool test_apply_veto() {
    sim::LuaScenario scn(pinephone_steps());
    TEST_ASSERT(scn.init(write_script("kbd_lua_scenario.lua", kScenario)), "Scenario loads");

    int applied = -1;
    TEST_ASSERT(scn.apply(PowerSourceId::Keyboard, 1500, applied), "Keyboard 1500 mA accepted");
    TEST_ASSERT(applied == 1500, "Keyboard limit not quantized");
    TEST_ASSERT(!scn.apply(PowerSourceId::Keyboard, 2500, applied), "Keyboard 2500 mA vetoed");

    const auto kb = scn.read(PowerSourceId::Keyboard);
    TEST_ASSERT(kb.current_limit_mA && *kb.current_limit_mA == 1500, "Vetoed value not recorded");
    return true;
}

bool test_script_error_gives_unknown_sample() {
    sim::LuaScenario scn(pinephone_steps());
    TEST_ASSERT(scn.init(write_script("kbd_lua_scenario.lua", kScenario)), "Scenario loads");

    for (int i = 0; i < 3; ++i) scn.advance();
    const auto kb = scn.read(PowerSourceId::Keyboard);
    TEST_ASSERT(kb.all_unknown(), "Failing call yields an unknown sample");

    const auto phone = scn.read(PowerSourceId::Phone);
    TEST_ASSERT(phone.voltage_mV.has_value(), "Phone unaffected by the keyboard error");
    return true;
}

bool test_scenario_done() {
    sim::LuaScenario scn(pinephone_steps());
    TEST_ASSERT(scn.init(write_script("kbd_lua_scenario.lua", kScenario)), "Scenario loads");

    int cycles = 0;
    while (!scn.finished() && cycles < 100) {
        scn.advance();
        ++cycles;
    }
    TEST_ASSERT(cycles == 5, "scenario_done ends the run after 5 cycles");

    sim::LuaScenario open_ended(pinephone_steps());
    TEST_ASSERT(open_ended.init(write_script("kbd_lua_open.lua",
        "function scenario_sample() return {} end\n")), "Minimal scenario loads");
    open_ended.advance();
    TEST_ASSERT(!open_ended.finished(), "No scenario_done: never finished");
    return true;
}

int main() {
    utils::set_level(utils::LogLevel::Error);

    int passed = 0;
    int failed = 0;
    int total = 0;

    std::cout << "=== Lua Scenario Tests ===" << std::endl;

    RUN_TEST(test_init_requires_sample_function);
    RUN_TEST(test_read_fields);
    RUN_TEST(test_apply_feeds_back);
    RUN_TEST(test_apply_veto);
    RUN_TEST(test_script_error_gives_unknown_sample);
    RUN_TEST(test_scenario_done);

    std::cout << std::endl;
    std::cout << "Results: " << passed << "/" << total << " passed";
    if (failed > 0) {
        std::cout << " (" << failed << " failed)";
    }
    std::cout << std::endl;

    return failed > 0 ? 1 : 0;
}
