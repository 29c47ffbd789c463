// src/power/quantizing_actuator.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <map>
#include <utility>

#include "power/limit_actuator.hpp"
#include "power/limit_steps.hpp"

namespace power {

/**
 * QuantizingActuator - In-memory actuator for dry runs, replay and tests.
 *
 * Phone requests are quantized to the step list, keyboard requests are
 * clamped at zero. The most recent kMaxHistory applied values are kept
 * in history(), oldest first.
 */
class QuantizingActuator : public LimitActuator {
public:
    struct Applied {
        PowerSourceId id;
        int requested_mA;
        int applied_mA;
    };

    static constexpr size_t kMaxHistory = 256;

    explicit QuantizingActuator(LimitSteps steps) : steps_(std::move(steps)) {}

    bool apply(PowerSourceId id, int requested_mA, int& applied_mA) override {
        if (fail_) return false;

        const int v = (id == PowerSourceId::Phone) ? steps_.quantize(requested_mA)
                                                   : std::max(0, requested_mA);
        current_[id] = v;
        history_.push_back({id, requested_mA, v});
        if (history_.size() > kMaxHistory) {
            history_.pop_front();
        }
        applied_mA = v;
        return true;
    }

    const char* name() const override { return "dry-run"; }

    // Makes every following apply() fail (actuation fault injection)
    void set_fail(bool fail) { fail_ = fail; }

    bool has(PowerSourceId id) const { return current_.count(id) != 0; }
    int current(PowerSourceId id) const { return current_.at(id); }
    const std::deque<Applied>& history() const { return history_; }

private:
    LimitSteps steps_;
    bool fail_ = false;
    std::map<PowerSourceId, int> current_;
    std::deque<Applied> history_;
};

} // namespace power
