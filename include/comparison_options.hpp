#ifndef COMPARISON_OPTIONS_HPP
#define COMPARISON_OPTIONS_HPP

#include <optional>
#include <set>
#include <string>

namespace simval {

/**
 * @brief Settings of one comparison pass.
 *
 * The reference dataset and the output destination are not part of the options:
 * the reference is handed to DatasetComparator::compare and the output dataset is
 * returned to the caller.
 */
struct ComparisonOptions {
    bool warnings = false;             ///< Emit recoverable-condition warnings to the diagnostic stream.
    std::set<std::string> interpolate; ///< Dimensions along which the reference may be interpolated.

    /// Restrict the comparison to these variables; std::nullopt compares all candidates.
    std::optional<std::set<std::string>> vars;
};

} // namespace simval

#endif // COMPARISON_OPTIONS_HPP
