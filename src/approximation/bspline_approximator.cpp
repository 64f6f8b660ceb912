#include "approximation/bspline_approximator.hpp"

#include <Eigen/Core>
#include <Eigen/SparseCore>
#include <Eigen/SparseLU>
#include <algorithm> // For std::upper_bound, std::min
#include <cmath>     // For std::isfinite, std::isnan
#include <limits>
#include <string>    // For std::to_string
#include <type_traits>

namespace simval {

template<typename T>
BSplineApproximator<T>::BSplineApproximator(unsigned int degree)
  : degree_(degree) {
    if (degree_ % 2 == 0 || degree_ > kMaxDegree) {
        throw std::invalid_argument("BSplineApproximator: degree must be 1, 3 or 5, got " + std::to_string(degree_) +
                                    ".");
    }
}

template<typename T>
size_t
BSplineApproximator<T>::find_span(double x) const {
    const size_t n = knot_vector_.size() - degree_ - 1; // Number of basis functions
    if (x >= knot_vector_[n]) { return n - 1; }
    if (x <= knot_vector_[degree_]) { return degree_; }
    auto it = std::upper_bound(knot_vector_.begin() + degree_, knot_vector_.begin() + n + 1, x);
    return std::min(n - 1, static_cast<size_t>(it - knot_vector_.begin()) - 1);
}

template<typename T>
std::vector<double>
BSplineApproximator<T>::basis_functions(size_t span, double x) const {
    // Cox-de Boor triangle, see Piegl & Tiller, "The NURBS Book", algorithm A2.2.
    const size_t p = degree_;
    std::vector<double> N(p + 1, 0.0), left(p + 1, 0.0), right(p + 1, 0.0);
    N[0] = 1.0;
    for (size_t j = 1; j <= p; ++j) {
        left[j] = x - knot_vector_[span + 1 - j];
        right[j] = knot_vector_[span + j] - x;
        double saved = 0.0;
        for (size_t r = 0; r < j; ++r) {
            double temp = N[r] / (right[r + 1] + left[j - r]);
            N[r] = saved + right[r + 1] * temp;
            saved = left[j - r] * temp;
        }
        N[j] = saved;
    }
    return N;
}

template<typename T>
template<typename U>
U
BSplineApproximator<T>::evaluate_templated(size_t span, U x) const {
    const size_t p = degree_;
    std::vector<U> d;
    d.reserve(p + 1);
    for (size_t j = 0; j <= p; ++j) { d.push_back(U(coefficients_[j + span - p])); }

    for (size_t r = 1; r <= p; ++r) {
        for (size_t j = p; j >= r; --j) {
            const double left_knot = knot_vector_[j + span - p];
            const double right_knot = knot_vector_[j + 1 + span - r];
            U alpha = (x - left_knot) / (right_knot - left_knot);
            d[j] = (1.0 - alpha) * d[j - 1] + alpha * d[j];
        }
    }
    return d[p];
}

template<typename T>
void
BSplineApproximator<T>::fit(const std::vector<double> &knots, const std::vector<T> &values) {
    const size_t n = knots.size();
    const size_t p = degree_;
    if (n != values.size()) {
        throw std::invalid_argument("BSplineApproximator::fit: " + std::to_string(n) + " knots but " +
                                    std::to_string(values.size()) + " values.");
    }
    if (n < p + 1) {
        throw std::invalid_argument("BSplineApproximator::fit: degree " + std::to_string(p) + " needs at least " +
                                    std::to_string(p + 1) + " samples, got " + std::to_string(n) + ".");
    }
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(knots[i])) {
            throw std::invalid_argument("BSplineApproximator::fit: knot " + std::to_string(i) + " is not finite.");
        }
        if (i > 0 && !(knots[i] > knots[i - 1])) {
            throw std::invalid_argument("BSplineApproximator::fit: knots must be strictly increasing (index " +
                                        std::to_string(i) + ").");
        }
    }

    fitted_ = false;

    // Not-a-knot knot vector: boundary knots repeated p+1 times, interior knots skip
    // m samples next to each end.
    const size_t m = (p - 1) / 2;
    knot_vector_.clear();
    knot_vector_.reserve(n + p + 1);
    knot_vector_.insert(knot_vector_.end(), p + 1, knots.front());
    for (size_t i = m + 1; i + m + 1 < n; ++i) { knot_vector_.push_back(knots[i]); }
    knot_vector_.insert(knot_vector_.end(), p + 1, knots.back());

    // Collocation matrix is banded: row i holds the p+1 basis functions alive at knots[i].
    std::vector<Eigen::Triplet<T>> triplets;
    triplets.reserve(n * (p + 1));
    for (size_t i = 0; i < n; ++i) {
        const size_t span = find_span(knots[i]);
        const std::vector<double> N = basis_functions(span, knots[i]);
        for (size_t r = 0; r <= p; ++r) {
            if (N[r] != 0.0) {
                triplets.emplace_back(static_cast<int>(i), static_cast<int>(span - p + r), static_cast<T>(N[r]));
            }
        }
    }

    const auto dim = static_cast<Eigen::Index>(n);
    Eigen::SparseMatrix<T> A(dim, dim);
    A.setFromTriplets(triplets.begin(), triplets.end());
    A.makeCompressed();

    Eigen::SparseLU<Eigen::SparseMatrix<T>, Eigen::COLAMDOrdering<int>> solver;
    solver.analyzePattern(A);
    solver.factorize(A);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("BSplineApproximator::fit: collocation matrix factorization failed: " +
                                 solver.lastErrorMessage());
    }

    Eigen::Map<const Eigen::Matrix<T, Eigen::Dynamic, 1>> rhs(values.data(), dim);
    Eigen::Matrix<T, Eigen::Dynamic, 1> c = solver.solve(rhs);
    if (solver.info() != Eigen::Success) {
        throw std::runtime_error("BSplineApproximator::fit: collocation solve failed.");
    }

    coefficients_.assign(c.data(), c.data() + c.size());
    fitted_ = true;
}

template<typename T>
T
BSplineApproximator<T>::evaluate(double x) const {
    if (!fitted_) { throw std::runtime_error("BSplineApproximator::evaluate called before fit."); }
    if (std::isnan(x)) { return std::numeric_limits<T>::quiet_NaN(); }
    return evaluate_templated<T>(find_span(x), static_cast<T>(x));
}

template<typename T>
T
BSplineApproximator<T>::derivative(double x, int order) const {
    if (!fitted_) { throw std::runtime_error("BSplineApproximator::derivative called before fit."); }
    if (order < 0) { throw std::invalid_argument("Derivative order cannot be negative."); }
    if (std::isnan(x)) { return std::numeric_limits<T>::quiet_NaN(); }
    if (order == 0) { return evaluate(x); }
    // A degree-p piecewise polynomial has vanishing derivatives above order p.
    if (static_cast<unsigned int>(order) > degree_) { return T(0.0); }

    if constexpr (std::is_same_v<T, double>) {
        auto x_fvar = boost::math::differentiation::make_fvar<double, kMaxDegree>(x);
        auto result_fvar = evaluate_templated(find_span(x), x_fvar);
        return result_fvar.derivative(static_cast<unsigned int>(order));
    } else {
        throw std::runtime_error("Autodiff-based derivative not implemented for this type");
    }
}

template<typename T>
const std::vector<double> &
BSplineApproximator<T>::knot_vector() const {
    if (!fitted_) { throw std::runtime_error("BSplineApproximator::knot_vector called before fit."); }
    return knot_vector_;
}

template<typename T>
const std::vector<T> &
BSplineApproximator<T>::coefficients() const {
    if (!fitted_) { throw std::runtime_error("BSplineApproximator::coefficients called before fit."); }
    return coefficients_;
}

// Explicit instantiation for double
template class BSplineApproximator<double>;

} // namespace simval
