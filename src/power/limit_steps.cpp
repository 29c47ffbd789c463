// src/power/limit_steps.cpp
#include "power/limit_steps.hpp"

#include <algorithm>
#include <cstdlib>

namespace power {

bool LimitSteps::valid() const {
    if (steps_.empty() || steps_.front() <= 0) return false;
    for (size_t i = 1; i < steps_.size(); ++i) {
        if (steps_[i] <= steps_[i - 1]) return false;
    }
    return true;
}

bool LimitSteps::contains(int mA) const {
    return std::binary_search(steps_.begin(), steps_.end(), mA);
}

int LimitSteps::quantize(int mA) const {
    if (mA <= steps_.front()) return steps_.front();
    if (mA >= steps_.back()) return steps_.back();

    auto hi = std::lower_bound(steps_.begin(), steps_.end(), mA);
    if (*hi == mA) return mA;
    auto lo = hi - 1;
    return (mA - *lo) <= (*hi - mA) ? *lo : *hi;
}

int LimitSteps::step_up(int cur_mA) const {
    auto it = std::upper_bound(steps_.begin(), steps_.end(), cur_mA);
    return it == steps_.end() ? steps_.back() : *it;
}

int LimitSteps::step_down(int cur_mA) const {
    auto it = std::lower_bound(steps_.begin(), steps_.end(), cur_mA);
    if (it == steps_.begin()) return steps_.front();
    return *(it - 1);
}

int LimitSteps::step_toward(int cur_mA, int target_mA) const {
    if (cur_mA < target_mA) return std::min(step_up(cur_mA), target_mA);
    if (cur_mA > target_mA) return std::max(step_down(cur_mA), target_mA);
    return cur_mA;
}

int LimitSteps::distance(int a_mA, int b_mA) const {
    const int qa = quantize(a_mA);
    const int qb = quantize(b_mA);
    const auto ia = std::lower_bound(steps_.begin(), steps_.end(), qa) - steps_.begin();
    const auto ib = std::lower_bound(steps_.begin(), steps_.end(), qb) - steps_.begin();
    return static_cast<int>(std::labs(static_cast<long>(ia - ib)));
}

} // namespace power
