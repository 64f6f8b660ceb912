#ifndef DATASET_HPP
#define DATASET_HPP

#include "labeled_array.hpp"
#include <map>
#include <string>
#include <utility> // For std::move
#include <vector>

namespace simval {

/**
 * @brief A named collection of labeled arrays sharing dimension coordinates.
 *
 * Holds the variables, the dataset-level coordinate array of every dimension
 * referenced by them, and free-form string attributes.
 */
class Dataset {
  public:
    /**
     * @brief Insert a variable, requiring coordinate agreement.
     *
     * Coordinates of dimensions not yet known to the dataset are registered.
     * @throws std::invalid_argument if a variable of that name exists, or if one of its
     *         coordinate arrays differs from the one already registered for that dimension.
     */
    void add_variable(LabeledArray variable);

    /**
     * @brief Insert or replace a variable without coordinate checks.
     *
     * Coordinates of new dimensions are registered; already registered coordinates
     * are left untouched (first writer wins).
     */
    void merge_variable(LabeledArray variable);

    bool has_variable(const std::string &name) const { return variables_.count(name) > 0; }

    /**
     * @throws std::out_of_range if the variable does not exist.
     */
    const LabeledArray &variable(const std::string &name) const;

    /// Variable names in lexicographic order.
    std::vector<std::string> variable_names() const;

    const std::map<std::string, LabeledArray> &variables() const { return variables_; }
    const std::map<std::string, Coordinate> &coordinates() const { return coordinates_; }

    /**
     * @throws std::out_of_range if the dimension is unknown.
     */
    const Coordinate &coordinate(const std::string &dim) const;

    void set_attribute(const std::string &key, std::string value) { attributes_[key] = std::move(value); }

    /**
     * @throws std::out_of_range if the attribute is not set.
     */
    const std::string &attribute(const std::string &key) const;
    const std::map<std::string, std::string> &attributes() const { return attributes_; }

    size_t size() const { return variables_.size(); }
    bool empty() const { return variables_.empty(); }

  private:
    std::map<std::string, LabeledArray> variables_;
    std::map<std::string, Coordinate> coordinates_;
    std::map<std::string, std::string> attributes_;
};

} // namespace simval

#endif // DATASET_HPP
