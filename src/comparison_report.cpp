#include "comparison_report.hpp"

#include "error_metrics.hpp"
#include <algorithm>
#include <iomanip>
#include <string>

namespace simval {

namespace {

const std::string kAbserrSuffix = ".abserr";

bool
ends_with(const std::string &s, const std::string &suffix) {
    return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<std::string>
compared_variables(const Dataset &result) {
    std::vector<std::string> names;
    for (const auto &entry : result.variables()) {
        if (ends_with(entry.first, kAbserrSuffix)) {
            names.push_back(entry.first.substr(0, entry.first.size() - kAbserrSuffix.size()));
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void
write_report(std::ostream &os, const Dataset &result) {
    const std::vector<std::string> names = compared_variables(result);
    const auto &metrics = metric_names();

    size_t name_width = 10;
    for (const auto &name : names) { name_width = std::max(name_width, name.size() + 2); }
    const int col = 15;

    const auto old_flags = os.flags();
    const auto old_precision = os.precision();
    os << std::left << std::setw(static_cast<int>(name_width)) << "variable";
    for (size_t m = 2; m < metrics.size(); ++m) { os << std::right << std::setw(col) << metrics[m]; }
    os << '\n';

    os << std::scientific << std::setprecision(6);
    for (const auto &name : names) {
        os << std::left << std::setw(static_cast<int>(name_width)) << name;
        for (size_t m = 2; m < metrics.size(); ++m) {
            os << std::right << std::setw(col) << result.variable(name + "." + metrics[m]).value();
        }
        os << '\n';
    }
    os.flags(old_flags);
    os.precision(old_precision);
}

} // namespace simval
