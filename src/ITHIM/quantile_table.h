#pragma once

#include "age_sex_table.h"
#include "monotonic_vector.h"
#include "ITHIM.Core/array2d.h"
#include "ITHIM.Core/forward_type.h"

#include <map>
#include <vector>

namespace ithim {

/// @brief Defines the stratum by exposure quantile table data type
///
/// @details Holds one age class by quantile matrix per gender, all sharing the
/// same strictly increasing age classes and quantile probabilities. Used for
/// exposure times, MET exposure, relative risks and normalised burden shapes.
class QuantileTable {
  public:
    /// @brief Initialises a new instance of the QuantileTable class
    QuantileTable() = default;

    /// @brief Initialises a new instance of the QuantileTable class with zero values
    /// @param age_classes The strictly increasing age classes
    /// @param quantiles The strictly increasing quantile probabilities
    QuantileTable(const MonotonicVector<int> &age_classes,
                  const MonotonicVector<double> &quantiles);

    /// @brief Gets the number of age classes
    /// @return Number of age classes
    std::size_t rows() const noexcept;

    /// @brief Gets the number of quantiles
    /// @return Number of quantiles
    std::size_t columns() const noexcept;

    /// @brief Determine whether the table is empty
    /// @return true, if the table has no data; otherwise, false
    bool empty() const noexcept;

    /// @brief Gets the table age classes in increasing order
    /// @return The age classes
    const std::vector<int> &age_classes() const noexcept;

    /// @brief Gets the quantile probabilities in increasing order
    /// @return The quantile probabilities
    const std::vector<double> &quantiles() const noexcept;

    /// @brief Gets a value at a given stratum and quantile
    /// @param age_class The age class
    /// @param gender The gender
    /// @param quantile The zero-based quantile index
    /// @return The value
    /// @throws std::out_of_range for unknown stratum or quantile index
    double &at(int age_class, core::Gender gender, std::size_t quantile);

    /// @brief Gets a read-only value at a given stratum and quantile
    /// @param age_class The age class
    /// @param gender The gender
    /// @param quantile The zero-based quantile index
    /// @return The value
    /// @throws std::out_of_range for unknown stratum or quantile index
    const double &at(int age_class, core::Gender gender, std::size_t quantile) const;

    /// @brief Sums a stratum values across the quantiles axis
    /// @param age_class The age class
    /// @param gender The gender
    /// @return The stratum total
    double row_sum(int age_class, core::Gender gender) const;

    /// @brief Sums every stratum across the quantiles axis
    /// @return The stratum totals table
    DoubleAgeSexTable row_sums() const;

    /// @brief Gets the read-only age class by quantile matrix of a gender
    /// @param gender The gender
    /// @return The gender matrix
    const core::DoubleArray2D &values(core::Gender gender) const;

    /// @brief Determines whether another table shares age classes and quantiles
    /// @param other The other table
    /// @return true, if both tables are aligned; otherwise, false
    bool same_shape(const QuantileTable &other) const noexcept;

    /// @brief Compare two tables for exact equality
    /// @param rhs The table to compare to this instance.
    /// @return true if the tables have the same shape and values; otherwise, false.
    bool operator==(const QuantileTable &rhs) const;

  private:
    std::vector<int> age_classes_{};
    std::vector<double> quantiles_{};
    std::map<int, std::size_t> rows_index_{};
    core::DoubleArray2D males_{};
    core::DoubleArray2D females_{};

    core::DoubleArray2D &gender_values(core::Gender gender);
};

/// @brief Creates a new table applying a function to every value of a source table
/// @tparam UnaryFunction Function type, receives (age class, gender, quantile index, value)
/// @param source The source table
/// @param func The function object to apply
/// @return The new table
template <class UnaryFunction>
QuantileTable transform_quantiles(const QuantileTable &source, UnaryFunction func) {
    auto result = QuantileTable(MonotonicVector<int>(source.age_classes()),
                                MonotonicVector<double>(source.quantiles()));
    for (const auto &age_class : source.age_classes()) {
        for (const auto &gender : stratum_genders) {
            for (std::size_t q = 0; q < source.columns(); q++) {
                result.at(age_class, gender, q) =
                    func(age_class, gender, q, source.at(age_class, gender, q));
            }
        }
    }

    return result;
}

/// @brief Creates a new table combining the values of two aligned tables element-wise
/// @tparam BinaryFunction Function type, receives (left value, right value)
/// @param left The left table
/// @param right The right table
/// @param func The function object to apply
/// @return The new table
/// @throws core::InputFormatError for tables with different strata or quantiles
template <class BinaryFunction>
QuantileTable combine_quantiles(const QuantileTable &left, const QuantileTable &right,
                                BinaryFunction func) {
    if (!left.same_shape(right)) {
        throw core::InputFormatError(
            "Quantile tables must have the same age classes and quantile probabilities.");
    }

    return transform_quantiles(
        left, [&right, &func](int age_class, core::Gender gender, std::size_t q, double value) {
            return func(value, right.at(age_class, gender, q));
        });
}
} // namespace ithim
