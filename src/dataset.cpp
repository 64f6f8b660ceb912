#include "dataset.hpp"

#include <stdexcept>
#include <utility>

namespace simval {

void
Dataset::add_variable(LabeledArray variable) {
    const std::string name = variable.name();
    if (has_variable(name)) { throw std::invalid_argument("Dataset already contains variable '" + name + "'."); }

    const auto &dims = variable.dims();
    for (size_t d = 0; d < dims.size(); ++d) {
        auto it = coordinates_.find(dims[d]);
        if (it != coordinates_.end() && it->second != variable.coords()[d]) {
            throw std::invalid_argument("Variable '" + name + "' disagrees with the dataset coordinates of dimension '" +
                                        dims[d] + "'.");
        }
    }
    merge_variable(std::move(variable));
}

void
Dataset::merge_variable(LabeledArray variable) {
    const auto &dims = variable.dims();
    for (size_t d = 0; d < dims.size(); ++d) { coordinates_.emplace(dims[d], variable.coords()[d]); }

    std::string name = variable.name();
    variables_.insert_or_assign(std::move(name), std::move(variable));
}

const LabeledArray &
Dataset::variable(const std::string &name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) { throw std::out_of_range("Dataset has no variable '" + name + "'."); }
    return it->second;
}

std::vector<std::string>
Dataset::variable_names() const {
    std::vector<std::string> names;
    names.reserve(variables_.size());
    for (const auto &entry : variables_) { names.push_back(entry.first); }
    return names;
}

const Coordinate &
Dataset::coordinate(const std::string &dim) const {
    auto it = coordinates_.find(dim);
    if (it == coordinates_.end()) { throw std::out_of_range("Dataset has no coordinate '" + dim + "'."); }
    return it->second;
}

const std::string &
Dataset::attribute(const std::string &key) const {
    auto it = attributes_.find(key);
    if (it == attributes_.end()) { throw std::out_of_range("Dataset has no attribute '" + key + "'."); }
    return it->second;
}

} // namespace simval
