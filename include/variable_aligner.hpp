#ifndef VARIABLE_ALIGNER_HPP
#define VARIABLE_ALIGNER_HPP

#include "comparison_options.hpp"
#include "labeled_array.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace simval {

/**
 * @brief Input and reference values of one variable, placed on common indices.
 */
struct AlignedVariable {
    LabeledArray input;                           ///< Input values (possibly index-truncated).
    LabeledArray reference;                       ///< Reference values on the input's indices.
    std::vector<double> interpolation_error;      ///< Pointwise bound; zeros without interpolation.
    std::optional<std::string> interpolation_dim; ///< Dimension interpolated along, if any.
};

/// True if both sequences hold the same dimension names in the same order.
bool
same_dimensions(const std::vector<std::string> &a, const std::vector<std::string> &b);

/// True if both sequences have the same length.
bool
same_rank(const std::vector<std::string> &a, const std::vector<std::string> &b);

/**
 * @brief Decides per variable between reference interpolation and pointwise comparison.
 */
class VariableAligner {
  public:
    explicit VariableAligner(ComparisonOptions options, std::ostream &diagnostics = std::cerr);

    /**
     * @brief Align an input variable with its reference.
     *
     * @param input      Variable from the input dataset.
     * @param reference  Variable of the same name from the reference dataset.
     * @return The aligned pair, or std::nullopt if the variable cannot be compared.
     * @throws std::invalid_argument if interpolation is attempted on unusable coordinates.
     */
    std::optional<AlignedVariable> align(const LabeledArray &input, const LabeledArray &reference) const;

    /**
     * @brief Interpolation dimension for a variable: the lexicographically first
     *        eligible dimension among its dimensions.
     */
    std::optional<std::string> select_interpolation_dim(const std::vector<std::string> &dims) const;

  private:
    ComparisonOptions options_;
    std::ostream &diagnostics_;

    AlignedVariable align_pointwise(const LabeledArray &input, const LabeledArray &reference) const;

    void warn(const std::string &message) const;
};

} // namespace simval

#endif // VARIABLE_ALIGNER_HPP
