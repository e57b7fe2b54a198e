#pragma once

#include "age_sex_table.h"
#include "disease.h"

#include <map>
#include <optional>
#include <vector>

namespace ithim {

/// @brief Defines the baseline disease burden data type
///
/// @details Externally supplied burden estimates, e.g. Global Burden of Disease,
/// indexed by disease and burden type, each holding a stratified table.
/// Every table must share the same age classes.
class DiseaseBurdenTable {
  public:
    /// @brief Gets the number of disease and burden type tables
    /// @return Number of tables
    std::size_t size() const noexcept;

    /// @brief Determine whether the table is empty
    /// @return true, if the table has no data; otherwise, false
    bool empty() const noexcept;

    /// @brief Adds or replaces the stratified burden of a disease and burden type
    /// @param disease The disease type
    /// @param burden The burden type
    /// @param values The stratified burden values
    /// @throws core::InputFormatError for values with different age classes
    void add(DiseaseType disease, BurdenType burden, DoubleAgeSexTable values);

    /// @brief Determines whether the table has any burden for a disease
    /// @param disease The disease type
    /// @return true, if the disease exists; otherwise, false
    bool contains(DiseaseType disease) const noexcept;

    /// @brief Determines whether the table has a disease burden type
    /// @param disease The disease type
    /// @param burden The burden type
    /// @return true, if the disease burden type exists; otherwise, false
    bool contains(DiseaseType disease, BurdenType burden) const noexcept;

    /// @brief Gets the stratified burden of a disease and burden type
    /// @param disease The disease type
    /// @param burden The burden type
    /// @return The stratified burden values
    /// @throws core::MissingBurdenDataError for missing disease or burden type
    const DoubleAgeSexTable &at(DiseaseType disease, BurdenType burden) const;

    /// @brief Gets the burden value of a single stratum
    /// @param disease The disease type
    /// @param burden The burden type
    /// @param age_class The stratum age class
    /// @param gender The stratum gender
    /// @return The burden value
    /// @throws core::MissingBurdenDataError for missing disease, burden type or stratum
    double at(DiseaseType disease, BurdenType burden, int age_class, core::Gender gender) const;

    /// @brief Gets the diseases with burden data, in enumeration order
    /// @return The diseases list
    std::vector<DiseaseType> diseases() const;

    /// @brief Gets the burden tables age classes
    /// @return The age classes, empty if the table is empty
    const std::vector<int> &age_classes() const noexcept;

    /// @brief Sums the burden of all strata for one or all diseases
    /// @param burden The burden type
    /// @param disease The disease to sum, all diseases if empty
    /// @return The total burden
    /// @throws core::MissingBurdenDataError for missing disease or burden type
    double total(BurdenType burden, std::optional<DiseaseType> disease = std::nullopt) const;

    /// @brief Validates that every disease has all burden types for the given strata
    /// @param age_classes The required age classes
    /// @throws core::MissingBurdenDataError for missing burden types or strata
    void validate(const std::vector<int> &age_classes) const;

  private:
    std::map<DiseaseType, std::map<BurdenType, DoubleAgeSexTable>> data_{};
    std::vector<int> age_classes_{};
};
} // namespace ithim
