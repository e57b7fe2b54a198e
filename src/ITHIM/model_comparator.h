#pragma once

#include "attributable_fraction.h"
#include "disease.h"
#include "dose_response.h"
#include "model.h"

#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace ithim {

/// @brief Defines the comparison results of one disease
struct DiseaseComparison {
    /// @brief The relative risk and attributable fraction results
    DiseaseRiskResult risk{};

    /// @brief Scenario minus baseline burden by burden type
    std::map<BurdenType, DoubleAgeSexTable> delta{};
};

/// @brief Defines the baseline and scenario comparison report data type
class ComparisonReport {
  public:
    /// @brief Initialises a new instance of the ComparisonReport class
    /// @param results The diseases comparison results
    explicit ComparisonReport(std::map<DiseaseType, DiseaseComparison> results);

    /// @brief Gets the compared diseases, in enumeration order
    /// @return The diseases list
    std::vector<DiseaseType> diseases() const;

    /// @brief Determines whether the report has a disease
    /// @param disease The disease type
    /// @return true, if the disease has been compared; otherwise, false
    bool contains(DiseaseType disease) const noexcept;

    /// @brief Gets the comparison results of a disease
    /// @param disease The disease type
    /// @return The disease results
    /// @throws core::MissingBurdenDataError for a disease without burden data
    const DiseaseComparison &at(DiseaseType disease) const;

    /// @brief Sums the burden delta of one or all diseases across all strata
    /// @param burden The burden type
    /// @param disease The disease to sum, all diseases if empty
    /// @return The total burden delta
    /// @throws core::MissingBurdenDataError for a disease without burden data
    double delta_burden(BurdenType burden, std::optional<DiseaseType> disease = std::nullopt) const;

  private:
    std::map<DiseaseType, DiseaseComparison> results_;
};

/// @brief Implements the baseline and scenario comparative risk assessment
class ModelComparator {
  public:
    /// @brief Initialises a new instance of the ModelComparator class with literature curves
    ModelComparator() = default;

    /// @brief Initialises a new instance of the ModelComparator class
    /// @param dose_response The diseases dose-response model
    explicit ModelComparator(DoseResponseModel dose_response);

    /// @brief Compares a scenario with the baseline for every disease with burden data
    /// @param baseline The baseline model, provides the disease burden
    /// @param scenario The scenario model
    /// @return The comparison report
    /// @throws core::InputFormatError for models with different strata or quantiles
    /// @throws core::MissingBurdenDataError for incomplete disease burden data
    ComparisonReport compare(const Model &baseline, const Model &scenario) const;

  private:
    std::optional<DoseResponseModel> dose_response_{};
};

/// @brief Computes the change in disease burden between baseline and scenario
/// @param baseline The baseline model
/// @param scenario The scenario model
/// @param burden The burden type
/// @param disease The disease to report, all diseases if empty
/// @return The total burden delta, age class 1 included
double delta_burden(const Model &baseline, const Model &scenario,
                    BurdenType burden = BurdenType::daly,
                    std::optional<DiseaseType> disease = std::nullopt);

/// @brief Computes the change in disease burden between baseline and scenario
/// @param baseline The baseline model
/// @param scenario The scenario model
/// @param burden The burden type name: deaths, yll, yld or daly
/// @param disease The disease name or "all"
/// @return The total burden delta, age class 1 included
/// @throws core::ConfigurationError for unknown burden type or disease names
double delta_burden(const Model &baseline, const Model &scenario, std::string_view burden,
                    std::string_view disease = "all");

/// @brief Gets the baseline disease burden of a model, injuries excluded
/// @param model The model
/// @param burden The burden type
/// @param disease The disease to report, all diseases if empty
/// @return The total burden
/// @throws core::MissingBurdenDataError for missing disease burden data
double get_burden(const Model &model, BurdenType burden = BurdenType::daly,
                  std::optional<DiseaseType> disease = std::nullopt);

/// @brief Gets the baseline disease burden of a model, injuries excluded
/// @param model The model
/// @param burden The burden type name: deaths, yll, yld or daly
/// @param disease The disease name or "all"
/// @return The total burden
/// @throws core::ConfigurationError for unknown burden type or disease names
double get_burden(const Model &model, std::string_view burden, std::string_view disease = "all");

/// @brief Converts a disease filter name into an optional disease, "all" is empty
/// @param name The disease filter name
/// @return The disease type, empty for all diseases
/// @throws core::ConfigurationError for unknown disease names
std::optional<DiseaseType> parse_disease_filter(std::string_view name);
} // namespace ithim
