#ifndef LABELED_ARRAY_HPP
#define LABELED_ARRAY_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace simval {

/// Ordered coordinate values along one named dimension.
using Coordinate = std::vector<double>;

/**
 * @brief An n-dimensional array of doubles with named dimensions.
 *
 * Each dimension carries its own coordinate array. Data is stored row-major,
 * i.e. the last dimension varies fastest. A rank-0 array holds exactly one value.
 */
class LabeledArray {
  public:
    LabeledArray() = default;

    /**
     * @brief Construct a labeled array.
     *
     * @param name   Variable name.
     * @param dims   Dimension names, outermost first.
     * @param coords One coordinate array per dimension, same order as dims.
     * @param data   Row-major values.
     * @throws std::invalid_argument if dims and coords disagree in count, a dimension
     *         name repeats, or data.size() is not the product of the coordinate lengths.
     */
    LabeledArray(std::string name,
                 std::vector<std::string> dims,
                 std::vector<Coordinate> coords,
                 std::vector<double> data);

    /**
     * @brief Build a rank-0 array holding a single value.
     */
    static LabeledArray scalar(std::string name, double value);

    const std::string &name() const { return name_; }
    const std::vector<std::string> &dims() const { return dims_; }
    const std::vector<Coordinate> &coords() const { return coords_; }
    const std::vector<double> &data() const { return data_; }

    size_t rank() const { return dims_.size(); }
    size_t size() const { return data_.size(); }
    std::vector<size_t> shape() const;

    bool has_dim(const std::string &dim) const;

    /**
     * @brief Coordinate array of a dimension.
     * @throws std::out_of_range if the array has no such dimension.
     */
    const Coordinate &coord(const std::string &dim) const;

    /**
     * @brief Element at a multi-index.
     * @throws std::out_of_range if the index has the wrong rank or is out of bounds.
     */
    double at(const std::vector<size_t> &index) const;

    /**
     * @brief Value of a rank-0 array.
     * @throws std::logic_error if the array is not rank-0.
     */
    double value() const;

    /// Copy of this array under another name.
    LabeledArray renamed(std::string new_name) const;

    /**
     * @brief Sub-array covering indices [0, extents[d]) along each dimension d.
     *
     * Coordinates are truncated along with the data.
     * @throws std::invalid_argument if extents has the wrong rank or exceeds the shape.
     */
    LabeledArray leading_slice(const std::vector<size_t> &extents) const;

  private:
    std::string name_;
    std::vector<std::string> dims_;
    std::vector<Coordinate> coords_;
    std::vector<double> data_{ 0.0 }; // Default-constructed array is a rank-0 zero.
};

} // namespace simval

#endif // LABELED_ARRAY_HPP
