#ifndef BSPLINE_APPROXIMATOR_HPP
#define BSPLINE_APPROXIMATOR_HPP

#include <boost/math/differentiation/autodiff.hpp>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace simval {

/**
 * @brief Interpolating B-spline of odd degree with not-a-knot end conditions.
 *
 * For n samples and degree p the knot vector repeats each end sample p+1 times and
 * uses samples m+1 .. n-m-2 as interior knots, m = (p-1)/2. This gives exactly n
 * basis functions, so the spline passes through every sample. Degree 3 is the
 * classical not-a-knot cubic spline; degree 5 is its quintic analogue.
 *
 * @tparam T The numeric type of the sampled values (double).
 */
template<typename T>
class BSplineApproximator {
  public:
    /// Highest supported degree; also the compile-time autodiff order.
    static constexpr unsigned int kMaxDegree = 5;

    /**
     * @brief Construct a B-spline approximator.
     *
     * @param degree Spline degree: 1, 3 or 5 (default: 3).
     * @throws std::invalid_argument if degree is even or exceeds kMaxDegree.
     */
    explicit BSplineApproximator(unsigned int degree = 3);

    /**
     * @brief Solve for the spline coefficients interpolating the samples.
     *
     * @param knots   Strictly increasing sample coordinates.
     * @param values  Sample values.
     * @throws std::invalid_argument if sizes differ, fewer than degree+1 samples are
     *         given, or the coordinates are not finite and strictly increasing.
     * @throws std::runtime_error if the collocation system cannot be factorized.
     */
    void fit(const std::vector<double> &knots, const std::vector<T> &values);

    /**
     * @brief Evaluate the spline at x with de Boor's algorithm.
     *
     * Outside the sampled range the boundary polynomial piece is extended.
     * A NaN x yields NaN.
     * @throws std::runtime_error if the model has not been fitted.
     */
    T evaluate(double x) const;

    /**
     * @brief Evaluate the nth derivative of the spline at x using Boost.Autodiff.
     *
     * Orders above the spline degree are identically zero. A NaN x yields NaN.
     * @throws std::runtime_error if the model has not been fitted.
     * @throws std::invalid_argument if order is negative.
     */
    T derivative(double x, int order) const;

    unsigned int degree() const { return degree_; }

    /// True once fit() has succeeded.
    bool fitted() const { return fitted_; }

    /**
     * @brief Full knot vector (boundary knots repeated degree+1 times).
     * @throws std::runtime_error if the model has not been fitted.
     */
    const std::vector<double> &knot_vector() const;

    /**
     * @brief B-spline coefficients, one per sample.
     * @throws std::runtime_error if the model has not been fitted.
     */
    const std::vector<T> &coefficients() const;

  private:
    unsigned int degree_;
    bool fitted_ = false;
    std::vector<double> knot_vector_;
    std::vector<T> coefficients_;

    /// Index k with t_k <= x < t_{k+1}, clamped to the valid spans [p, n-1].
    size_t find_span(double x) const;

    /// Values of the p+1 basis functions that are nonzero on span k, at x.
    std::vector<double> basis_functions(size_t span, double x) const;

    /**
     * @brief de Boor recurrence on a given span.
     * @tparam U T or a boost::math::differentiation fvar.
     */
    template<typename U>
    U evaluate_templated(size_t span, U x) const;
};

} // namespace simval

#endif // BSPLINE_APPROXIMATOR_HPP
