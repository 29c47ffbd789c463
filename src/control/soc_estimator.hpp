// src/control/soc_estimator.hpp
#pragma once

#include <optional>
#include <vector>

#include "power/power_sample.hpp"

namespace control {

/**
 * SocEstimator - Approximate state of charge for a battery that may lack
 * a fuel gauge. A reported capacity always wins over any estimate.
 */
class SocEstimator {
public:
    virtual ~SocEstimator() = default;

    virtual std::optional<int> estimate(const power::PowerSourceSample& s) const = 0;

    virtual const char* name() const = 0;
};

/**
 * VoltageSocEstimator - Piecewise-linear lookup from terminal voltage.
 *
 * Under load the terminal voltage sags by I*R; with a non-zero
 * internal_resistance_mohm the discharge current is added back before
 * the lookup. Result is clamped to 0..100.
 */
class VoltageSocEstimator : public SocEstimator {
public:
    struct Point {
        int mV;
        int pct;
    };

    explicit VoltageSocEstimator(std::vector<Point> curve = default_curve(),
                                 int internal_resistance_mohm = 0);

    std::optional<int> estimate(const power::PowerSourceSample& s) const override;

    const char* name() const override { return "voltage"; }

    // Single-cell Li-ion resting curve
    static std::vector<Point> default_curve();

    // Ascending in mV and pct, at least two points
    static bool valid_curve(const std::vector<Point>& curve);

    int lookup(int mV) const;

private:
    std::vector<Point> curve_;
    int resistance_mohm_;
};

} // namespace control
