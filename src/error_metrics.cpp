#include "error_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string> // For std::to_string
#include <utility>

namespace simval {

namespace {

// Maximum that propagates NaN regardless of its position.
double
max_of(const std::vector<double> &values) {
    double result = values.front();
    for (double v : values) {
        if (std::isnan(v)) { return v; }
        result = std::max(result, v);
    }
    return result;
}

double
root_mean_square(const std::vector<double> &values) {
    double sum = 0.0;
    for (double v : values) { sum += v * v; }
    return std::sqrt(sum / static_cast<double>(values.size()));
}

} // namespace

const std::vector<std::string> &
metric_names() {
    static const std::vector<std::string> names = { "delta",      "interperr",     "abserr",    "abserr.lb",
                                                    "abserr.rms", "abserr.rms.lb", "relerr",    "relerr.lb",
                                                    "relerr.rms", "relerr.rms.lb" };
    return names;
}

ErrorMetrics
compute_error_metrics(const LabeledArray &input,
                      const LabeledArray &reference,
                      const std::vector<double> &interpolation_error) {
    const size_t n = input.size();
    if (n == 0) { throw std::invalid_argument("compute_error_metrics: '" + input.name() + "' is empty."); }
    if (reference.size() != n || interpolation_error.size() != n) {
        throw std::invalid_argument("compute_error_metrics: size mismatch for '" + input.name() + "' (input " +
                                    std::to_string(n) + ", reference " + std::to_string(reference.size()) +
                                    ", interpolation error " + std::to_string(interpolation_error.size()) + ").");
    }

    const auto &v = input.data();
    const auto &r = reference.data();

    std::vector<double> delta(n), abs_delta(n), delta_lb(n);
    double r_absmax = 0.0;
    for (size_t i = 0; i < n; ++i) {
        delta[i] = v[i] - r[i];
        abs_delta[i] = std::abs(delta[i]);
        const double deflated = abs_delta[i] - interpolation_error[i];
        delta_lb[i] = std::isnan(deflated) ? deflated : std::max(0.0, deflated);
        r_absmax = std::isnan(r[i]) ? r[i] : std::max(r_absmax, std::abs(r[i]));
    }

    ErrorMetrics metrics;
    metrics.delta = LabeledArray(input.name(), input.dims(), input.coords(), std::move(delta));
    metrics.interpolation_error = LabeledArray(input.name(), input.dims(), input.coords(), interpolation_error);

    metrics.abserr = max_of(abs_delta);
    metrics.abserr_lb = max_of(delta_lb);
    metrics.abserr_rms = root_mean_square(abs_delta);
    metrics.abserr_rms_lb = root_mean_square(delta_lb);

    if (std::isnan(r_absmax) || r_absmax > 0.0) {
        metrics.relerr = metrics.abserr / r_absmax;
        metrics.relerr_lb = metrics.abserr_lb / r_absmax;
        metrics.relerr_rms = metrics.abserr_rms / r_absmax;
        metrics.relerr_rms_lb = metrics.abserr_rms_lb / r_absmax;
    }
    return metrics;
}

std::vector<LabeledArray>
metrics_to_arrays(const std::string &variable, const ErrorMetrics &metrics) {
    const auto &names = metric_names();
    auto key = [&](size_t i) { return variable + "." + names[i]; };

    return { metrics.delta.renamed(key(0)),
             metrics.interpolation_error.renamed(key(1)),
             LabeledArray::scalar(key(2), metrics.abserr),
             LabeledArray::scalar(key(3), metrics.abserr_lb),
             LabeledArray::scalar(key(4), metrics.abserr_rms),
             LabeledArray::scalar(key(5), metrics.abserr_rms_lb),
             LabeledArray::scalar(key(6), metrics.relerr),
             LabeledArray::scalar(key(7), metrics.relerr_lb),
             LabeledArray::scalar(key(8), metrics.relerr_rms),
             LabeledArray::scalar(key(9), metrics.relerr_rms_lb) };
}

} // namespace simval
