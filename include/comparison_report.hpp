#ifndef COMPARISON_REPORT_HPP
#define COMPARISON_REPORT_HPP

#include "dataset.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace simval {

/**
 * @brief Variables that have error metrics in a comparison result, in lexicographic order.
 *
 * Recovered from the "<var>.abserr" entries.
 */
std::vector<std::string>
compared_variables(const Dataset &result);

/**
 * @brief Print one row per compared variable with its eight scalar metrics.
 */
void
write_report(std::ostream &os, const Dataset &result);

} // namespace simval

#endif // COMPARISON_REPORT_HPP
