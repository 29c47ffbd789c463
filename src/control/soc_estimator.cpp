// src/control/soc_estimator.cpp
#include "control/soc_estimator.hpp"

#include <algorithm>
#include <utility>

namespace control {

VoltageSocEstimator::VoltageSocEstimator(std::vector<Point> curve, int internal_resistance_mohm)
    : curve_(std::move(curve)), resistance_mohm_(internal_resistance_mohm) {}

std::vector<VoltageSocEstimator::Point> VoltageSocEstimator::default_curve() {
    return {
        {3300, 0},
        {3500, 5},
        {3600, 12},
        {3680, 25},
        {3740, 40},
        {3800, 55},
        {3870, 70},
        {3950, 82},
        {4050, 92},
        {4150, 100},
    };
}

bool VoltageSocEstimator::valid_curve(const std::vector<Point>& curve) {
    if (curve.size() < 2) return false;
    for (size_t i = 1; i < curve.size(); ++i) {
        if (curve[i].mV <= curve[i - 1].mV) return false;
        if (curve[i].pct < curve[i - 1].pct) return false;
    }
    return true;
}

int VoltageSocEstimator::lookup(int mV) const {
    if (curve_.empty()) return 0;
    if (mV <= curve_.front().mV) return std::max(0, curve_.front().pct);
    if (mV >= curve_.back().mV) return std::min(100, curve_.back().pct);

    auto hi = std::upper_bound(curve_.begin(), curve_.end(), mV,
                               [](int v, const Point& p) { return v < p.mV; });
    auto lo = hi - 1;

    const int span_mV = hi->mV - lo->mV;
    const int pct = lo->pct + ((mV - lo->mV) * (hi->pct - lo->pct) + span_mV / 2) / span_mV;
    return std::max(0, std::min(100, pct));
}

std::optional<int> VoltageSocEstimator::estimate(const power::PowerSourceSample& s) const {
    if (s.capacity_pct) return s.capacity_pct;
    if (!s.voltage_mV) return std::nullopt;

    int mV = *s.voltage_mV;
    if (resistance_mohm_ > 0 && s.current_mA && *s.current_mA < 0) {
        mV += (-*s.current_mA) * resistance_mohm_ / 1000;
    }
    return lookup(mV);
}

} // namespace control
