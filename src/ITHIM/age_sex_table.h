#pragma once
#include <map>
#include <stdexcept>
#include <vector>

#include "monotonic_vector.h"
#include "ITHIM.Core/array2d.h"
#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/forward_type.h"

#include <fmt/format.h>

namespace ithim {

/// @brief The gender columns of a stratified table, in storage order
inline const std::vector<core::Gender> stratum_genders{core::Gender::male, core::Gender::female};

/// @brief Gets the storage column of a gender in stratified tables
/// @param gender The gender value
/// @return The zero-based column index
/// @throws std::out_of_range for unknown gender
inline std::size_t gender_column(const core::Gender gender) {
    switch (gender) {
    case core::Gender::male:
        return 0;
    case core::Gender::female:
        return 1;
    default:
        throw std::out_of_range("Stratified tables only hold male and female values.");
    }
}

/// @brief Defines the age class and sex stratified table data type
///
/// @details Rows are the age classes, given in strictly increasing order,
/// and the two columns are males and females.
/// @tparam TYPE The cell value type
template <core::Numerical TYPE> class AgeSexTable {
  public:
    /// @brief Initialises a new instance of the AgeSexTable class
    AgeSexTable() = default;

    /// @brief Initialises a new instance of the AgeSexTable class with a default value
    /// @param age_classes The strictly increasing age classes
    /// @param value The initial value for all strata
    explicit AgeSexTable(const MonotonicVector<int> &age_classes, TYPE value = TYPE{})
        : AgeSexTable(age_classes, core::Array2D<TYPE>(age_classes.size(), 2, value)) {}

    /// @brief Initialises a new instance of the AgeSexTable class
    /// @param age_classes The strictly increasing age classes
    /// @param values The full table values, age classes by (male, female)
    /// @throws core::InputFormatError for age classes and values table size mismatch
    AgeSexTable(const MonotonicVector<int> &age_classes, core::Array2D<TYPE> &&values)
        : age_classes_{age_classes.values()}, table_{std::move(values)} {
        if (age_classes.size() != table_.rows() || table_.columns() != stratum_genders.size()) {
            throw core::InputFormatError(
                fmt::format("Stratum table shape mismatch: {} age classes by 2 sexes, given {}x{}.",
                            age_classes.size(), table_.rows(), table_.columns()));
        }

        auto rows_count = age_classes_.size();
        for (std::size_t index = 0; index < rows_count; index++) {
            rows_index_.emplace(age_classes_[index], index);
        }
    }

    /// @brief Gets the lookup table size
    /// @return Lookup table size
    std::size_t size() const noexcept { return table_.size(); }

    /// @brief Get the number of age classes
    /// @return Number of rows
    std::size_t rows() const noexcept { return table_.rows(); }

    /// @brief Determine whether the table is empty
    /// @return true, if the table has no data; otherwise, false
    bool empty() const noexcept { return rows_index_.empty(); }

    /// @brief Gets the table age classes in increasing order
    /// @return The age classes
    const std::vector<int> &age_classes() const noexcept { return age_classes_; }

    /// @brief Gets a value at a given age class and gender intersection
    /// @param age_class The age class
    /// @param gender The gender
    /// @return The stratum value
    /// @throws std::out_of_range for accessing unknown strata
    TYPE &at(const int age_class, const core::Gender gender) {
        return table_(rows_index_.at(age_class), gender_column(gender));
    }

    /// @brief Gets a read-only value at a given age class and gender intersection
    /// @param age_class The age class
    /// @param gender The gender
    /// @return The stratum value
    /// @throws std::out_of_range for accessing unknown strata
    const TYPE &at(const int age_class, const core::Gender gender) const {
        return table_(rows_index_.at(age_class), gender_column(gender));
    }

    /// @brief Gets a value at a given age class and gender intersection
    /// @param age_class The age class
    /// @param gender The gender
    /// @return The stratum value
    /// @throws std::out_of_range for accessing unknown strata
    TYPE &operator()(const int age_class, const core::Gender gender) {
        return at(age_class, gender);
    }

    /// @brief Gets a read-only value at a given age class and gender intersection
    /// @param age_class The age class
    /// @param gender The gender
    /// @return The stratum value
    /// @throws std::out_of_range for accessing unknown strata
    const TYPE &operator()(const int age_class, const core::Gender gender) const {
        return at(age_class, gender);
    }

    /// @brief Determines whether the table contains a stratum
    /// @param age_class The age class
    /// @param gender The gender
    /// @return true, if the table contains the stratum; otherwise, false
    bool contains(const int age_class, const core::Gender gender) const noexcept {
        return rows_index_.contains(age_class) &&
               (gender == core::Gender::male || gender == core::Gender::female);
    }

    /// @brief Determines whether another table has the same age classes
    /// @param other The other table
    /// @return true, if both tables share the strata; otherwise, false
    template <core::Numerical OTHER>
    bool same_strata(const AgeSexTable<OTHER> &other) const noexcept {
        return age_classes_ == other.age_classes();
    }

    /// @brief Sums the values of all strata
    /// @return The table total
    TYPE sum() const noexcept {
        auto total = TYPE{};
        for (std::size_t row = 0; row < table_.rows(); row++) {
            total += table_.row_sum(row);
        }

        return total;
    }

    /// @brief Sums the values of all age classes for one gender
    /// @param gender The gender
    /// @return The gender total
    TYPE sum(const core::Gender gender) const {
        auto column = gender_column(gender);
        auto total = TYPE{};
        for (std::size_t row = 0; row < table_.rows(); row++) {
            total += table_(row, column);
        }

        return total;
    }

    /// @brief Compare two tables for exact equality
    /// @param rhs The table to compare to this instance.
    /// @return true if the tables have the same strata and values; otherwise, false.
    bool operator==(const AgeSexTable<TYPE> &rhs) const {
        return age_classes_ == rhs.age_classes_ && table_ == rhs.table_;
    }

  private:
    std::vector<int> age_classes_{};
    core::Array2D<TYPE> table_{};
    std::map<int, std::size_t> rows_index_{};
};

/// @brief Creates a new table applying a function to each stratum value of a source table
/// @tparam TYPE The cell value type
/// @tparam UnaryFunction Function type, receives (age class, gender, value)
/// @param source The source table
/// @param func The function object to apply
/// @return The new table
template <core::Numerical TYPE, class UnaryFunction>
AgeSexTable<TYPE> transform_strata(const AgeSexTable<TYPE> &source, UnaryFunction func) {
    auto result = AgeSexTable<TYPE>(MonotonicVector<int>(source.age_classes()));
    for (const auto &age_class : source.age_classes()) {
        for (const auto &gender : stratum_genders) {
            result.at(age_class, gender) = func(age_class, gender, source.at(age_class, gender));
        }
    }

    return result;
}

/// @brief Creates a new table combining the stratum values of two tables
/// @tparam TYPE The cell value type
/// @tparam BinaryFunction Function type, receives (left value, right value)
/// @param left The left table
/// @param right The right table
/// @param func The function object to apply
/// @return The new table
/// @throws core::InputFormatError for tables with different age classes
template <core::Numerical TYPE, class BinaryFunction>
AgeSexTable<TYPE> combine_strata(const AgeSexTable<TYPE> &left, const AgeSexTable<TYPE> &right,
                                 BinaryFunction func) {
    if (!left.same_strata(right)) {
        throw core::InputFormatError("Stratified tables must have the same age classes.");
    }

    return transform_strata(left, [&right, &func](int age_class, core::Gender gender, TYPE value) {
        return func(value, right.at(age_class, gender));
    });
}

/// @brief Age class and sex stratified table for double precision floating-point values
using DoubleAgeSexTable = AgeSexTable<double>;
} // namespace ithim
