#ifndef SPLINE_ERROR_ESTIMATOR_HPP
#define SPLINE_ERROR_ESTIMATOR_HPP

#include <cstddef>
#include <vector>

namespace simval {

/// Fewest reference samples accepted for interpolation (a quintic needs six).
constexpr size_t kMinInterpolationSamples = 6;

/// Constant of the cubic spline supremum-norm bound (5/384) h^4 max|f''''|.
constexpr double kCubicSplineErrorConstant = 5.0 / 384.0;

/// Inflation of the fourth-derivative estimate at the first and last knot.
constexpr double kEndIntervalFactor = 3.0;

/// Fourth-derivative window: knots [i - 1, i + 2].
constexpr size_t kDerivativeWindowBefore = 1;
constexpr size_t kDerivativeWindowAfter = 2;

/// Knot-gap window: gaps [j - 1, j + 1].
constexpr size_t kSpacingWindowBefore = 1;
constexpr size_t kSpacingWindowAfter = 1;

/**
 * @brief Interpolated values with a pointwise interpolation error bound.
 */
struct InterpolationEstimate {
    std::vector<double> values; ///< Cubic spline evaluated at the target coordinates.
    std::vector<double> error;  ///< Error bound at the same coordinates.
};

/**
 * @brief Interpolate samples with a cubic spline and bound the interpolation error.
 *
 * The bound at each target point is (5/384) * hmax^4 * d4max, where d4max is a
 * windowed maximum of |f''''| estimated from a quintic spline at the knots (the first
 * and last estimate inflated by kEndIntervalFactor) and hmax a windowed maximum of
 * the knot spacing. Both windowed sequences are looked up as step functions.
 *
 * @param t     Strictly increasing sample coordinates.
 * @param x     Sample values, same length as t.
 * @param tnew  Target coordinates. A NaN target gets a NaN value and error.
 * @return InterpolationEstimate with values and error of the same length as tnew.
 * @throws std::invalid_argument if t and x differ in length, t has fewer than
 *         kMinInterpolationSamples entries, or t is not strictly increasing.
 */
InterpolationEstimate
interpolate(const std::vector<double> &t, const std::vector<double> &x, const std::vector<double> &tnew);

/**
 * @brief Sliding-window maximum.
 *
 * result[i] = max(values[i - before .. i + after]), window clamped to the sequence.
 */
std::vector<double>
windowed_max(const std::vector<double> &values, size_t before, size_t after);

/**
 * @brief Previous-value lookup of a step function defined at knots.
 *
 * Returns values[k] for the last knot k with knots[k] <= x; values[0] below the
 * first knot.
 * @throws std::invalid_argument if knots is empty or the sizes differ.
 */
double
step_lookup(const std::vector<double> &knots, const std::vector<double> &values, double x);

} // namespace simval

#endif // SPLINE_ERROR_ESTIMATOR_HPP
