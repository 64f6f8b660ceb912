#include "labeled_array.hpp"

#include <algorithm>
#include <stdexcept>
#include <string> // For std::to_string
#include <utility>

namespace simval {

LabeledArray::LabeledArray(std::string name,
                           std::vector<std::string> dims,
                           std::vector<Coordinate> coords,
                           std::vector<double> data)
  : name_(std::move(name))
  , dims_(std::move(dims))
  , coords_(std::move(coords))
  , data_(std::move(data)) {
    if (dims_.size() != coords_.size()) {
        throw std::invalid_argument("LabeledArray '" + name_ + "': " + std::to_string(dims_.size()) +
                                    " dimensions but " + std::to_string(coords_.size()) + " coordinate arrays.");
    }
    for (size_t i = 0; i < dims_.size(); ++i) {
        if (std::find(dims_.begin() + i + 1, dims_.end(), dims_[i]) != dims_.end()) {
            throw std::invalid_argument("LabeledArray '" + name_ + "': dimension '" + dims_[i] + "' repeats.");
        }
    }

    size_t expected = 1;
    for (const auto &c : coords_) { expected *= c.size(); }
    if (data_.size() != expected) {
        throw std::invalid_argument("LabeledArray '" + name_ + "': data has " + std::to_string(data_.size()) +
                                    " elements, coordinates imply " + std::to_string(expected) + ".");
    }
}

LabeledArray
LabeledArray::scalar(std::string name, double value) {
    return LabeledArray(std::move(name), {}, {}, { value });
}

std::vector<size_t>
LabeledArray::shape() const {
    std::vector<size_t> result;
    result.reserve(coords_.size());
    for (const auto &c : coords_) { result.push_back(c.size()); }
    return result;
}

bool
LabeledArray::has_dim(const std::string &dim) const {
    return std::find(dims_.begin(), dims_.end(), dim) != dims_.end();
}

const Coordinate &
LabeledArray::coord(const std::string &dim) const {
    auto it = std::find(dims_.begin(), dims_.end(), dim);
    if (it == dims_.end()) {
        throw std::out_of_range("LabeledArray '" + name_ + "' has no dimension '" + dim + "'.");
    }
    return coords_[static_cast<size_t>(it - dims_.begin())];
}

double
LabeledArray::at(const std::vector<size_t> &index) const {
    if (index.size() != rank()) {
        throw std::out_of_range("LabeledArray '" + name_ + "': index of rank " + std::to_string(index.size()) +
                                " for array of rank " + std::to_string(rank()) + ".");
    }
    size_t flat = 0;
    for (size_t d = 0; d < index.size(); ++d) {
        if (index[d] >= coords_[d].size()) {
            throw std::out_of_range("LabeledArray '" + name_ + "': index " + std::to_string(index[d]) +
                                    " out of bounds along '" + dims_[d] + "'.");
        }
        flat = flat * coords_[d].size() + index[d];
    }
    return data_[flat];
}

double
LabeledArray::value() const {
    if (rank() != 0) { throw std::logic_error("LabeledArray '" + name_ + "' is not a scalar."); }
    return data_.front();
}

LabeledArray
LabeledArray::renamed(std::string new_name) const {
    LabeledArray copy = *this;
    copy.name_ = std::move(new_name);
    return copy;
}

LabeledArray
LabeledArray::leading_slice(const std::vector<size_t> &extents) const {
    if (extents.size() != rank()) {
        throw std::invalid_argument("LabeledArray::leading_slice: extents rank mismatch for '" + name_ + "'.");
    }
    const auto full = shape();
    for (size_t d = 0; d < extents.size(); ++d) {
        if (extents[d] > full[d]) {
            throw std::invalid_argument("LabeledArray::leading_slice: extent " + std::to_string(extents[d]) +
                                        " exceeds size " + std::to_string(full[d]) + " along '" + dims_[d] + "'.");
        }
    }
    if (extents == full) { return *this; }

    std::vector<Coordinate> sliced_coords;
    sliced_coords.reserve(coords_.size());
    size_t total = 1;
    for (size_t d = 0; d < extents.size(); ++d) {
        sliced_coords.emplace_back(coords_[d].begin(), coords_[d].begin() + extents[d]);
        total *= extents[d];
    }

    std::vector<double> sliced_data;
    sliced_data.reserve(total);
    if (total > 0) {
        // Odometer over the sliced index space, mapped back into the full row-major layout.
        std::vector<size_t> index(extents.size(), 0);
        for (size_t n = 0; n < total; ++n) {
            size_t flat = 0;
            for (size_t d = 0; d < index.size(); ++d) { flat = flat * full[d] + index[d]; }
            sliced_data.push_back(data_[flat]);

            for (size_t d = index.size(); d-- > 0;) {
                if (++index[d] < extents[d]) { break; }
                index[d] = 0;
            }
        }
    }

    return LabeledArray(name_, dims_, std::move(sliced_coords), std::move(sliced_data));
}

} // namespace simval
