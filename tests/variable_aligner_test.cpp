#include "variable_aligner.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <string>
#include <utility>

using simval::ComparisonOptions;
using simval::LabeledArray;
using simval::VariableAligner;

namespace {

ComparisonOptions
options_with(bool warnings, std::set<std::string> interpolate = {}) {
    ComparisonOptions options;
    options.warnings = warnings;
    options.interpolate = std::move(interpolate);
    return options;
}

double
square(double x) {
    return x * x;
}

} // namespace

TEST(DimensionPredicateTest, SameDimensionsAndRank) {
    EXPECT_TRUE(simval::same_dimensions({ "t", "x" }, { "t", "x" }));
    EXPECT_FALSE(simval::same_dimensions({ "t", "x" }, { "x", "t" }));
    EXPECT_FALSE(simval::same_dimensions({ "x" }, { "t", "x" }));
    EXPECT_TRUE(simval::same_rank({ "t", "x" }, { "x", "y" }));
    EXPECT_FALSE(simval::same_rank({ "x" }, {}));
}

TEST(VariableAlignerTest, SkipsDifferingDimensions) {
    std::ostringstream log;
    VariableAligner aligner(options_with(true), log);

    LabeledArray v = make_1d("v", "x", { 0.0, 1.0 }, square);
    LabeledArray r = make_1d("v", "y", { 0.0, 1.0 }, square);

    EXPECT_FALSE(aligner.align(v, r).has_value());
    EXPECT_NE(log.str().find("[VariableAligner] Warning"), std::string::npos);
    EXPECT_NE(log.str().find("'v'"), std::string::npos);
}

TEST(VariableAlignerTest, QuietWhenWarningsDisabled) {
    std::ostringstream log;
    VariableAligner aligner(options_with(false, { "x" }), log);

    LabeledArray v = make_1d("v", "x", linspace(0.0, 9.0, 10), square);
    EXPECT_FALSE(aligner.align(v, make_1d("v", "y", { 0.0, 1.0 }, square)).has_value());
    EXPECT_TRUE(aligner.align(v, make_1d("v", "x", { 0.0, 1.0, 2.0 }, square)).has_value());
    EXPECT_TRUE(log.str().empty());
}

TEST(VariableAlignerTest, InterpolatesOneDimensionalReference) {
    std::ostringstream log;
    VariableAligner aligner(options_with(true, { "x" }), log);

    LabeledArray v = make_1d("v", "x", linspace(0.0, 9.0, 10), square);
    LabeledArray r = make_1d("v", "x", { 0.0, 2.0, 4.0, 6.0, 8.0, 9.0 }, square);

    auto aligned = aligner.align(v, r);
    ASSERT_TRUE(aligned.has_value());
    ASSERT_TRUE(aligned->interpolation_dim.has_value());
    EXPECT_EQ(*aligned->interpolation_dim, "x");
    EXPECT_EQ(aligned->reference.coord("x"), v.coord("x"));
    EXPECT_EQ(aligned->input.data(), v.data());
    EXPECT_VECTOR_NEAR(aligned->reference.data(), v.data(), 1e-9);
    EXPECT_EQ(aligned->interpolation_error.size(), v.size());
    EXPECT_TRUE(log.str().empty());
}

TEST(VariableAlignerTest, FallsBackToPointwiseBelowSixSamples) {
    std::ostringstream log;
    VariableAligner aligner(options_with(true, { "x" }), log);

    LabeledArray v = make_1d("v", "x", linspace(0.0, 9.0, 10), square);
    LabeledArray r = make_1d("v", "x", { 0.0, 1.0, 2.0, 3.0, 4.0 }, square);

    auto aligned = aligner.align(v, r);
    ASSERT_TRUE(aligned.has_value());
    EXPECT_FALSE(aligned->interpolation_dim.has_value());
    EXPECT_EQ(aligned->input.size(), 5u);
    EXPECT_EQ(aligned->reference.data(), r.data());
    EXPECT_EQ(aligned->interpolation_error, std::vector<double>(5, 0.0));
    EXPECT_NE(log.str().find("only 5 reference samples"), std::string::npos);
    EXPECT_NE(log.str().find("'v'"), std::string::npos);
}

TEST(VariableAlignerTest, DoesNotInterpolateMultiDimensionalVariables) {
    std::ostringstream log;
    VariableAligner aligner(options_with(true, { "x" }), log);

    LabeledArray v("field", { "t", "x" }, { { 0.0, 1.0 }, { 0.0, 1.0, 2.0 } }, { 1, 2, 3, 4, 5, 6 });
    LabeledArray r("field", { "t", "x" }, { { 0.0, 1.0 }, { 0.0, 1.0, 2.0 } }, { 1, 2, 3, 4, 5, 7 });

    auto aligned = aligner.align(v, r);
    ASSERT_TRUE(aligned.has_value());
    EXPECT_FALSE(aligned->interpolation_dim.has_value());
    EXPECT_EQ(aligned->reference.data(), r.data());
    EXPECT_NE(log.str().find("'field'"), std::string::npos);
    EXPECT_NE(log.str().find("not supported"), std::string::npos);
}

TEST(VariableAlignerTest, SelectsLexicographicallyFirstDimension) {
    VariableAligner aligner(options_with(false, { "y", "b", "a" }));
    auto dim = aligner.select_interpolation_dim({ "y", "b" });
    ASSERT_TRUE(dim.has_value());
    EXPECT_EQ(*dim, "b");
    EXPECT_FALSE(aligner.select_interpolation_dim({ "x" }).has_value());
}

TEST(VariableAlignerTest, WarnsOnCoordinateMismatchAndComparesByIndex) {
    std::ostringstream log;
    VariableAligner aligner(options_with(true), log);

    LabeledArray v = make_1d("v", "x", { 0.0, 1.0, 2.0 }, square);
    LabeledArray r("v", { "x" }, { { 0.0, 1.5, 2.0 } }, { 0.0, 2.0, 4.0 });

    auto aligned = aligner.align(v, r);
    ASSERT_TRUE(aligned.has_value());
    EXPECT_EQ(aligned->input.size(), 3u);
    EXPECT_EQ(aligned->reference.data(), r.data());
    EXPECT_NE(log.str().find("comparing by index"), std::string::npos);
}

TEST(VariableAlignerTest, TruncatesToCommonIndexRange) {
    std::ostringstream log;
    VariableAligner aligner(options_with(false), log);

    LabeledArray v("f", { "t", "x" }, { { 0.0, 1.0, 2.0 }, { 0.0, 1.0 } }, { 1, 2, 3, 4, 5, 6 });
    LabeledArray r("f", { "t", "x" }, { { 0.0, 1.0 }, { 0.0, 1.0, 2.0 } }, { 1, 2, 9, 3, 4, 9 });

    auto aligned = aligner.align(v, r);
    ASSERT_TRUE(aligned.has_value());
    EXPECT_EQ(aligned->input.shape(), (std::vector<size_t>{ 2, 2 }));
    EXPECT_EQ(aligned->input.data(), (std::vector<double>{ 1, 2, 3, 4 }));
    EXPECT_EQ(aligned->reference.data(), (std::vector<double>{ 1, 2, 3, 4 }));
}

TEST(VariableAlignerTest, SkipsEmptyOverlap) {
    std::ostringstream log;
    VariableAligner aligner(options_with(true), log);

    LabeledArray v("v", { "x" }, std::vector<simval::Coordinate>{ simval::Coordinate{} }, {});
    LabeledArray r = make_1d("v", "x", { 0.0, 1.0 }, square);

    EXPECT_FALSE(aligner.align(v, r).has_value());
    EXPECT_NE(log.str().find("no overlapping samples"), std::string::npos);
}

TEST(VariableAlignerTest, ComparesScalarsDirectly) {
    VariableAligner aligner(options_with(false, { "x" }));
    auto aligned = aligner.align(LabeledArray::scalar("s", 2.0), LabeledArray::scalar("s", 1.5));
    ASSERT_TRUE(aligned.has_value());
    EXPECT_EQ(aligned->input.value(), 2.0);
    EXPECT_EQ(aligned->reference.value(), 1.5);
    EXPECT_EQ(aligned->interpolation_error, std::vector<double>{ 0.0 });
}
