#include "dataset_comparator.hpp"

#include "error_metrics.hpp"
#include <algorithm> // For std::find
#include <optional>
#include <set>
#include <utility>

namespace simval {

DatasetComparator::DatasetComparator(ComparisonOptions options, std::ostream &diagnostics)
  : options_(std::move(options))
  , diagnostics_(diagnostics)
  , aligner_(options_, diagnostics) {}

void
DatasetComparator::warn(const std::string &message) const {
    if (options_.warnings) { diagnostics_ << "[DatasetComparator] Warning: " << message << std::endl; }
}

std::vector<std::string>
DatasetComparator::comparable_variables(const Dataset &input, const Dataset &reference) const {
    std::vector<std::string> candidates;
    for (const auto &entry : input.variables()) {
        const std::string &name = entry.first;
        if (!reference.has_variable(name)) { continue; }
        if (!same_rank(entry.second.dims(), reference.variable(name).dims())) { continue; }
        candidates.push_back(name);
    }

    if (!options_.vars) { return candidates; }

    const std::set<std::string> &wanted = *options_.vars;
    std::vector<std::string> selected;
    for (const auto &name : candidates) {
        if (wanted.count(name)) { selected.push_back(name); }
    }

    if (selected.size() < wanted.size()) {
        std::string missing;
        for (const auto &name : wanted) {
            if (std::find(selected.begin(), selected.end(), name) != selected.end()) { continue; }
            if (!missing.empty()) { missing += ", "; }
            missing += name;
        }
        warn("requested variables not present in both datasets with matching rank: " + missing + ".");
    }
    return selected;
}

Dataset
DatasetComparator::compare(const Dataset &input, const Dataset &reference) const {
    Dataset result;
    for (const auto &attr : input.attributes()) { result.set_attribute(attr.first, attr.second); }

    const std::vector<std::string> candidates = comparable_variables(input, reference);

    std::set<std::string> unused_interp_dims = options_.interpolate;
    std::string compared;
    for (const auto &name : candidates) {
        const LabeledArray &v = input.variable(name);
        std::optional<AlignedVariable> aligned = aligner_.align(v, reference.variable(name));
        if (!aligned) { continue; }
        for (const auto &dim : v.dims()) { unused_interp_dims.erase(dim); }

        ErrorMetrics metrics = compute_error_metrics(aligned->input, aligned->reference, aligned->interpolation_error);
        for (auto &array : metrics_to_arrays(name, metrics)) { result.merge_variable(std::move(array)); }

        if (!compared.empty()) { compared += ","; }
        compared += name;
    }

    for (const auto &dim : unused_interp_dims) {
        warn("interpolation dimension '" + dim + "' is not a dimension of any compared variable.");
    }

    result.set_attribute("compared_variables", compared);
    return result;
}

Dataset
compare_datasets(const Dataset &input,
                 const Dataset &reference,
                 const ComparisonOptions &options,
                 std::ostream &diagnostics) {
    return DatasetComparator(options, diagnostics).compare(input, reference);
}

} // namespace simval
