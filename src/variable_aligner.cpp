#include "variable_aligner.hpp"

#include "spline_error_estimator.hpp"
#include <algorithm>
#include <string> // For std::to_string
#include <utility>

namespace simval {

namespace { // Anonymous namespace for helpers

std::string
format_dims(const std::vector<std::string> &dims) {
    std::string out = "(";
    for (size_t i = 0; i < dims.size(); ++i) {
        if (i > 0) { out += ", "; }
        out += dims[i];
    }
    return out + ")";
}

} // namespace

bool
same_dimensions(const std::vector<std::string> &a, const std::vector<std::string> &b) {
    return a == b;
}

bool
same_rank(const std::vector<std::string> &a, const std::vector<std::string> &b) {
    return a.size() == b.size();
}

VariableAligner::VariableAligner(ComparisonOptions options, std::ostream &diagnostics)
  : options_(std::move(options))
  , diagnostics_(diagnostics) {}

void
VariableAligner::warn(const std::string &message) const {
    if (options_.warnings) { diagnostics_ << "[VariableAligner] Warning: " << message << std::endl; }
}

std::optional<std::string>
VariableAligner::select_interpolation_dim(const std::vector<std::string> &dims) const {
    // std::set iterates in lexicographic order, which makes the choice deterministic.
    for (const auto &candidate : options_.interpolate) {
        if (std::find(dims.begin(), dims.end(), candidate) != dims.end()) { return candidate; }
    }
    return std::nullopt;
}

std::optional<AlignedVariable>
VariableAligner::align(const LabeledArray &input, const LabeledArray &reference) const {
    const std::string &name = input.name();
    if (!same_dimensions(input.dims(), reference.dims())) {
        warn("variable '" + name + "': input dimensions " + format_dims(input.dims()) +
             " differ from reference dimensions " + format_dims(reference.dims()) + "; skipping.");
        return std::nullopt;
    }

    std::optional<std::string> interp_dim = select_interpolation_dim(input.dims());
    if (interp_dim && input.rank() > 1) {
        warn("variable '" + name + "': interpolation along '" + *interp_dim + "' is not supported for " +
             std::to_string(input.rank()) + "-dimensional variables; comparing pointwise.");
        interp_dim.reset();
    }

    std::optional<AlignedVariable> aligned;
    if (interp_dim && reference.rank() == 1 && reference.dims().front() == *interp_dim) {
        const Coordinate &t = reference.coord(*interp_dim);
        if (t.size() < kMinInterpolationSamples) {
            warn("variable '" + name + "': only " + std::to_string(t.size()) + " reference samples along '" +
                 *interp_dim + "', need " + std::to_string(kMinInterpolationSamples) +
                 " to interpolate; comparing pointwise.");
        } else {
            const Coordinate &tnew = input.coord(*interp_dim);
            InterpolationEstimate estimate = interpolate(t, reference.data(), tnew);

            AlignedVariable result;
            result.input = input;
            result.reference = LabeledArray(reference.name(), input.dims(), input.coords(), std::move(estimate.values));
            result.interpolation_error = std::move(estimate.error);
            result.interpolation_dim = interp_dim;
            aligned = std::move(result);
        }
    }
    if (!aligned) { aligned = align_pointwise(input, reference); }

    if (aligned->input.size() == 0) {
        warn("variable '" + name + "': no overlapping samples between input and reference; skipping.");
        return std::nullopt;
    }
    return aligned;
}

AlignedVariable
VariableAligner::align_pointwise(const LabeledArray &input, const LabeledArray &reference) const {
    const auto &dims = input.dims();
    const auto input_shape = input.shape();
    const auto reference_shape = reference.shape();

    std::vector<size_t> extents(dims.size());
    for (size_t d = 0; d < dims.size(); ++d) {
        if (input.coords()[d] != reference.coords()[d]) {
            warn("variable '" + input.name() + "': coordinates along '" + dims[d] +
                 "' differ between input and reference; comparing by index.");
        }
        extents[d] = std::min(input_shape[d], reference_shape[d]);
    }

    AlignedVariable result;
    result.input = input.leading_slice(extents);
    result.reference = reference.leading_slice(extents);
    result.interpolation_error.assign(result.input.size(), 0.0);
    return result;
}

} // namespace simval
