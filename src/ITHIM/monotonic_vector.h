#pragma once

#include <vector>

#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/forward_type.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ithim {

/// @brief Determine whether a vector data is strictly increasing
/// @tparam TYPE The vector data type
/// @param values The vector value
/// @return true, if every element is greater than its predecessor; otherwise, false
template <core::Numerical TYPE> bool is_strictly_increasing(const std::vector<TYPE> &values) noexcept {
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (!(values[i - 1] < values[i])) {
            return false;
        }
    }

    return true;
}

/// @brief Defines a strictly increasing vector container type
/// @tparam TYPE The type of the elements
template <core::Numerical TYPE> class MonotonicVector {
  public:
    /// @brief Read-only element iterator
    using ConstIteratorType = typename std::vector<TYPE>::const_iterator;

    /// @brief Initialises a new instance of the MonotonicVector class.
    /// @param values The strictly increasing values
    /// @throws core::InputFormatError if the values are empty or not strictly increasing.
    explicit MonotonicVector(std::vector<TYPE> values) : data_{std::move(values)} {
        if (data_.empty()) {
            throw core::InputFormatError("Breakpoints must have at least one value.");
        }

        if (!is_strictly_increasing(data_)) {
            throw core::InputFormatError(
                fmt::format("Values must be supplied in strictly increasing order: {}.",
                            fmt::join(data_, ", ")));
        }
    }

    /// @brief Gets the number of elements
    /// @return NUmber of elements
    std::size_t size() const noexcept { return data_.size(); }

    /// @brief Gets a specified read-only element with bounds checking
    /// @param index The element index
    /// @return Reference to the requested element.
    const TYPE &operator[](std::size_t index) const { return data_.at(index); }

    /// @brief Gets the underlying values
    /// @return The strictly increasing values
    const std::vector<TYPE> &values() const noexcept { return data_; }

    /// @brief Gets an read-only iterator to the beginning of the elements
    /// @return Iterator to the first element
    ConstIteratorType begin() const noexcept { return data_.cbegin(); }

    /// @brief Gets an read-only iterator to the element following the element of the vector.
    /// @return Iterator to the element following the last element.
    ConstIteratorType end() const noexcept { return data_.cend(); }

    /// @brief Compare two vectors for equality
    /// @param rhs The vector to compare to this instance.
    /// @return true if both vectors hold the same values; otherwise, false
    bool operator==(const MonotonicVector<TYPE> &rhs) const = default;

  private:
    std::vector<TYPE> data_;
};
} // namespace ithim
