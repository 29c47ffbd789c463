// src/power/limit_steps.hpp
#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace power {

/**
 * LimitSteps - The discrete input-current limits a charger IC accepts.
 *
 * Steps are in mA and strictly ascending. All stepping helpers move by
 * exactly one entry and saturate at either end; a value that is not on
 * the grid steps to its grid neighbour in the requested direction.
 */
class LimitSteps {
public:
    LimitSteps() = default;
    explicit LimitSteps(std::vector<int> steps_mA) : steps_(std::move(steps_mA)) {}

    // Non-empty, positive, strictly ascending
    bool valid() const;

    bool empty() const { return steps_.empty(); }
    std::size_t size() const { return steps_.size(); }
    const std::vector<int>& values() const { return steps_; }

    int min() const { return steps_.front(); }
    int max() const { return steps_.back(); }

    bool contains(int mA) const;

    // Nearest step; ties resolve to the lower step
    int quantize(int mA) const;

    int step_up(int cur_mA) const;
    int step_down(int cur_mA) const;

    // One step from cur toward target (target itself once adjacent)
    int step_toward(int cur_mA, int target_mA) const;

    // Number of grid steps between two on-grid values (quantized first)
    int distance(int a_mA, int b_mA) const;

private:
    std::vector<int> steps_;
};

} // namespace power
