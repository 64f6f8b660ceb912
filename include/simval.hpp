#ifndef SIMVAL_HPP
#define SIMVAL_HPP

// Include all library headers here
#include "approximation/bspline_approximator.hpp"
#include "comparison_options.hpp"
#include "comparison_report.hpp"
#include "dataset.hpp"
#include "dataset_comparator.hpp"
#include "error_metrics.hpp"
#include "labeled_array.hpp"
#include "spline_error_estimator.hpp"
#include "variable_aligner.hpp"

// This is the main header file for the simval library
// Include this single header to access all functionality

#endif // SIMVAL_HPP
