#include "spline_error_estimator.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using simval::interpolate;
using simval::InterpolationEstimate;

TEST(WindowedMaxTest, ForwardBiasedWindow) {
    std::vector<double> values = { 1.0, 5.0, 2.0, 0.0, 3.0 };
    // Window [i-1, i+2].
    EXPECT_EQ(simval::windowed_max(values, 1, 2), (std::vector<double>{ 5.0, 5.0, 5.0, 3.0, 3.0 }));
}

TEST(WindowedMaxTest, CenteredWindow) {
    std::vector<double> values = { 4.0, 1.0, 1.0, 1.0, 2.0 };
    EXPECT_EQ(simval::windowed_max(values, 1, 1), (std::vector<double>{ 4.0, 4.0, 1.0, 2.0, 2.0 }));
}

TEST(WindowedMaxTest, ShortAndEmptySequences) {
    EXPECT_EQ(simval::windowed_max({ 2.0 }, 1, 2), (std::vector<double>{ 2.0 }));
    EXPECT_TRUE(simval::windowed_max({}, 1, 1).empty());
}

TEST(StepLookupTest, HoldsPreviousValue) {
    std::vector<double> knots = { 0.0, 1.0, 2.0 };
    std::vector<double> values = { 10.0, 20.0, 30.0 };

    EXPECT_EQ(simval::step_lookup(knots, values, -1.0), 10.0);
    EXPECT_EQ(simval::step_lookup(knots, values, 0.0), 10.0);
    EXPECT_EQ(simval::step_lookup(knots, values, 0.5), 10.0);
    EXPECT_EQ(simval::step_lookup(knots, values, 1.0), 20.0);
    EXPECT_EQ(simval::step_lookup(knots, values, 1.999), 20.0);
    EXPECT_EQ(simval::step_lookup(knots, values, 2.5), 30.0);
}

TEST(StepLookupTest, RejectsMismatchedInput) {
    EXPECT_THROW(simval::step_lookup({}, {}, 0.0), std::invalid_argument);
    EXPECT_THROW(simval::step_lookup({ 0.0, 1.0 }, { 1.0 }, 0.0), std::invalid_argument);
}

TEST(SplineErrorEstimatorTest, ReproducesCubicPolynomial) {
    auto func = [](double t) { return 2.0 * t * t * t - t * t + 0.5 * t - 4.0; };
    const std::vector<double> t = { 0.0, 0.3, 1.1, 1.5, 2.2, 3.0, 3.4, 4.1, 4.5, 5.0 };
    const std::vector<double> tnew = { 0.1, 0.7, 1.3, 2.0, 2.6, 3.2, 3.9, 4.3, 4.8 };

    InterpolationEstimate est = interpolate(t, sample(func, t), tnew);

    ASSERT_EQ(est.values.size(), tnew.size());
    ASSERT_EQ(est.error.size(), tnew.size());
    for (size_t i = 0; i < tnew.size(); ++i) {
        const double deviation = std::abs(est.values[i] - func(tnew[i]));
        EXPECT_LT(deviation, 1e-9) << "at t = " << tnew[i];
        EXPECT_GE(est.error[i], 0.0);
        // The quintic sees no fourth derivative, so the bound stays at rounding level.
        EXPECT_LT(est.error[i], 1e-6);
        EXPECT_LE(deviation, est.error[i] + 1e-9);
    }
}

TEST(SplineErrorEstimatorTest, BoundCoversSmoothFunction) {
    auto func = [](double t) { return std::exp(t); };
    const std::vector<double> t = linspace(0.0, 3.0, 16);

    // Midpoints of the interior intervals, away from the not-a-knot ends.
    std::vector<double> tnew;
    for (size_t i = 2; i + 3 < t.size(); ++i) { tnew.push_back(0.5 * (t[i] + t[i + 1])); }

    InterpolationEstimate est = interpolate(t, sample(func, t), tnew);

    double max_deviation = 0.0;
    double max_bound = 0.0;
    for (size_t i = 0; i < tnew.size(); ++i) {
        const double deviation = std::abs(est.values[i] - func(tnew[i]));
        EXPECT_LE(deviation, est.error[i]) << "at t = " << tnew[i];
        max_deviation = std::max(max_deviation, deviation);
        max_bound = std::max(max_bound, est.error[i]);
    }
    EXPECT_GT(max_deviation, 0.0);
    EXPECT_LT(max_bound, 100.0 * max_deviation);
}

TEST(SplineErrorEstimatorTest, BoundIsLocal) {
    // Flat on the left, strongly curved on the right.
    auto func = [](double t) { return t < 5.0 ? 1.0 : 1.0 + std::pow(t - 5.0, 6); };
    const std::vector<double> t = linspace(0.0, 10.0, 21);
    const std::vector<double> tnew = { 1.25, 8.75 };

    InterpolationEstimate est = interpolate(t, sample(func, t), tnew);

    EXPECT_LT(est.error[0], est.error[1]);
}

TEST(SplineErrorEstimatorTest, EndIntervalsAreInflated) {
    // Constant fourth derivative: the windowed estimate is largest where the end factor applies.
    auto func = [](double t) { return std::pow(t, 4); };
    const std::vector<double> t = linspace(0.0, 1.0, 11);
    const std::vector<double> tnew = { 0.05, 0.55 };

    InterpolationEstimate est = interpolate(t, sample(func, t), tnew);

    const double h = 0.1;
    const double interior = simval::kCubicSplineErrorConstant * std::pow(h, 4) * 24.0;
    EXPECT_NEAR(est.error[1], interior, 1e-6 * interior);
    EXPECT_NEAR(est.error[0], simval::kEndIntervalFactor * interior, 1e-6 * interior);
}

TEST(SplineErrorEstimatorTest, ExtrapolatesFlatlyBeyondSamples) {
    auto func = [](double t) { return std::sin(t); };
    const std::vector<double> t = linspace(0.0, 5.0, 11);
    const std::vector<double> tnew = { -1.0, t.front(), t.back(), 6.0 };

    InterpolationEstimate est = interpolate(t, sample(func, t), tnew);

    EXPECT_EQ(est.error[0], est.error[1]);
    EXPECT_EQ(est.error[2], est.error[3]);
}

TEST(SplineErrorEstimatorTest, RefusesFewerThanSixSamples) {
    const std::vector<double> t5 = { 0.0, 1.0, 2.0, 3.0, 4.0 };
    EXPECT_THROW(interpolate(t5, t5, { 0.5 }), std::invalid_argument);

    const std::vector<double> t6 = { 0.0, 1.0, 2.0, 3.0, 4.0, 5.0 };
    EXPECT_NO_THROW(interpolate(t6, t6, { 0.5 }));
}

TEST(SplineErrorEstimatorTest, RejectsMismatchedOrUnorderedSamples) {
    const std::vector<double> t = { 0.0, 1.0, 2.0, 3.0, 4.0, 5.0 };
    EXPECT_THROW(interpolate(t, { 1.0, 2.0 }, { 0.5 }), std::invalid_argument);

    const std::vector<double> unordered = { 0.0, 1.0, 3.0, 2.0, 4.0, 5.0 };
    EXPECT_THROW(interpolate(unordered, t, { 0.5 }), std::invalid_argument);
}

TEST(SplineErrorEstimatorTest, NanTargetGivesNanWithoutDisturbingNeighbours) {
    auto func = [](double t) { return t * t; };
    const std::vector<double> t = { 0.0, 2.0, 4.0, 6.0, 8.0, 9.0 };
    std::vector<double> tnew = linspace(0.0, 9.0, 10);
    tnew[3] = std::nan("");

    InterpolationEstimate est = interpolate(t, sample(func, t), tnew);

    ASSERT_EQ(est.values.size(), tnew.size());
    EXPECT_TRUE(std::isnan(est.values[3]));
    EXPECT_TRUE(std::isnan(est.error[3]));
    for (size_t i = 0; i < tnew.size(); ++i) {
        if (i == 3) { continue; }
        EXPECT_NEAR(est.values[i], func(tnew[i]), 1e-9) << "at t = " << tnew[i];
        EXPECT_TRUE(std::isfinite(est.error[i]));
    }
}
