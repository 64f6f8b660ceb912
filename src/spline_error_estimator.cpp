#include "spline_error_estimator.hpp"

#include "approximation/bspline_approximator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string> // For std::to_string

namespace simval {

std::vector<double>
windowed_max(const std::vector<double> &values, size_t before, size_t after) {
    std::vector<double> result(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const size_t lo = i > before ? i - before : 0;
        const size_t hi = std::min(values.size() - 1, i + after);
        result[i] = *std::max_element(values.begin() + lo, values.begin() + hi + 1);
    }
    return result;
}

double
step_lookup(const std::vector<double> &knots, const std::vector<double> &values, double x) {
    if (knots.empty() || knots.size() != values.size()) {
        throw std::invalid_argument("step_lookup: knots and values must be non-empty and of equal size.");
    }
    auto it = std::upper_bound(knots.begin(), knots.end(), x);
    if (it == knots.begin()) { return values.front(); }
    return values[static_cast<size_t>(it - knots.begin()) - 1];
}

InterpolationEstimate
interpolate(const std::vector<double> &t, const std::vector<double> &x, const std::vector<double> &tnew) {
    const size_t n = t.size();
    if (n != x.size()) {
        throw std::invalid_argument("interpolate: " + std::to_string(n) + " coordinates but " +
                                    std::to_string(x.size()) + " values.");
    }
    if (n < kMinInterpolationSamples) {
        throw std::invalid_argument("interpolate: need at least " + std::to_string(kMinInterpolationSamples) +
                                    " samples, got " + std::to_string(n) + ".");
    }

    BSplineApproximator<double> cubic(3);
    cubic.fit(t, x);

    // The cubic's own fourth derivative vanishes; estimate f'''' from a quintic instead.
    BSplineApproximator<double> quintic(5);
    quintic.fit(t, x);

    std::vector<double> d4(n);
    for (size_t i = 0; i < n; ++i) { d4[i] = std::abs(quintic.derivative(t[i], 4)); }
    d4.front() *= kEndIntervalFactor;
    d4.back() *= kEndIntervalFactor;

    std::vector<double> h(n - 1);
    for (size_t j = 0; j + 1 < n; ++j) { h[j] = t[j + 1] - t[j]; }

    const std::vector<double> d4max = windowed_max(d4, kDerivativeWindowBefore, kDerivativeWindowAfter);
    const std::vector<double> hmax = windowed_max(h, kSpacingWindowBefore, kSpacingWindowAfter);
    // Gap j starts at knot j.
    const std::vector<double> gap_knots(t.begin(), t.end() - 1);

    InterpolationEstimate estimate;
    estimate.values.reserve(tnew.size());
    estimate.error.reserve(tnew.size());
    for (double s : tnew) {
        if (std::isnan(s)) {
            estimate.values.push_back(std::numeric_limits<double>::quiet_NaN());
            estimate.error.push_back(std::numeric_limits<double>::quiet_NaN());
            continue;
        }
        estimate.values.push_back(cubic.evaluate(s));
        const double local_h = step_lookup(gap_knots, hmax, s);
        const double local_d4 = step_lookup(t, d4max, s);
        estimate.error.push_back(kCubicSplineErrorConstant * std::pow(local_h, 4) * local_d4);
    }
    return estimate;
}

} // namespace simval
