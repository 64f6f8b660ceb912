#ifndef ERROR_METRICS_HPP
#define ERROR_METRICS_HPP

#include "labeled_array.hpp"
#include <string>
#include <vector>

namespace simval {

/**
 * @brief Discrepancy measures of one variable against its reference.
 *
 * The ".lb" variants deflate |delta| by the interpolation error bound before the
 * reduction, so they bound the true error from below. Relative errors are scaled
 * by max|reference| and are 0 when the reference vanishes identically.
 * A NaN in the input, the reference or the interpolation error makes every
 * reduction it enters NaN.
 */
struct ErrorMetrics {
    LabeledArray delta;               ///< input - reference
    LabeledArray interpolation_error; ///< Pointwise interpolation error bound.
    double abserr = 0.0;
    double abserr_lb = 0.0;
    double abserr_rms = 0.0;
    double abserr_rms_lb = 0.0;
    double relerr = 0.0;
    double relerr_lb = 0.0;
    double relerr_rms = 0.0;
    double relerr_rms_lb = 0.0;
};

/**
 * @brief Output name suffixes, in the order delta, interperr, abserr, abserr.lb,
 *        abserr.rms, abserr.rms.lb, relerr, relerr.lb, relerr.rms, relerr.rms.lb.
 */
const std::vector<std::string> &
metric_names();

/**
 * @brief Compute the error metrics of aligned input and reference values.
 *
 * @param input                Aligned input values.
 * @param reference            Reference values on the same indices.
 * @param interpolation_error  Pointwise interpolation error bound, one per element.
 * @return ErrorMetrics whose arrays are labeled like the input.
 * @throws std::invalid_argument if the sizes disagree or the arrays are empty.
 */
ErrorMetrics
compute_error_metrics(const LabeledArray &input,
                      const LabeledArray &reference,
                      const std::vector<double> &interpolation_error);

/**
 * @brief The ten metrics as labeled arrays named "<variable>.<metric>".
 *
 * Scalars become rank-0 arrays. Order follows metric_names().
 */
std::vector<LabeledArray>
metrics_to_arrays(const std::string &variable, const ErrorMetrics &metrics);

} // namespace simval

#endif // ERROR_METRICS_HPP
