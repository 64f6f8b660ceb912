#ifndef DATASET_COMPARATOR_HPP
#define DATASET_COMPARATOR_HPP

#include "comparison_options.hpp"
#include "dataset.hpp"
#include "variable_aligner.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace simval {

/**
 * @brief Compares every comparable variable of an input dataset with a reference.
 *
 * For each variable the result dataset holds "<var>.delta", "<var>.interperr",
 * "<var>.abserr", "<var>.abserr.lb", "<var>.abserr.rms", "<var>.abserr.rms.lb",
 * "<var>.relerr", "<var>.relerr.lb", "<var>.relerr.rms" and "<var>.relerr.rms.lb".
 * Variables that cannot be aligned are left out. Warnings go to the diagnostic
 * stream only when ComparisonOptions::warnings is set.
 */
class DatasetComparator {
  public:
    explicit DatasetComparator(ComparisonOptions options, std::ostream &diagnostics = std::cerr);

    /**
     * @brief Run the comparison.
     *
     * @param input      Dataset under test.
     * @param reference  Reference dataset.
     * @return Dataset with the error metrics of each compared variable. The input's
     *         attributes are carried over and "compared_variables" lists the variables written.
     * @throws std::invalid_argument if a reference cannot be interpolated.
     */
    Dataset compare(const Dataset &input, const Dataset &reference) const;

    /**
     * @brief Names present in both datasets with equal rank, restricted by the
     *        variable filter, in lexicographic order.
     *
     * Filter entries that are not candidates are reported in one warning.
     */
    std::vector<std::string> comparable_variables(const Dataset &input, const Dataset &reference) const;

    const ComparisonOptions &options() const { return options_; }

  private:
    ComparisonOptions options_;
    std::ostream &diagnostics_;
    VariableAligner aligner_;

    void warn(const std::string &message) const;
};

/**
 * @brief One-shot helper around DatasetComparator::compare.
 */
Dataset
compare_datasets(const Dataset &input,
                 const Dataset &reference,
                 const ComparisonOptions &options,
                 std::ostream &diagnostics = std::cerr);

} // namespace simval

#endif // DATASET_COMPARATOR_HPP
