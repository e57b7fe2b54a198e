#pragma once

#include "age_sex_table.h"
#include "quantile_table.h"

namespace ithim {

/// @brief Defines the attributable fraction results of one disease
struct DiseaseRiskResult {
    /// @brief Relative risk quantiles at baseline exposure
    QuantileTable baseline_relative_risk{};

    /// @brief Relative risk quantiles at scenario exposure
    QuantileTable scenario_relative_risk{};

    /// @brief Baseline over scenario relative risk ratio
    QuantileTable normalised_to_baseline{};

    /// @brief Burden attributable fraction of the exposure change
    DoubleAgeSexTable attributable_fraction{};

    /// @brief Alternative attributable fraction of the normalised ratios, diagnostics only
    DoubleAgeSexTable alternative_attributable_fraction{};

    /// @brief Scenario relative risk shape, relative to the first quantile
    QuantileTable normalised_burden{};

    /// @brief Baseline relative risk shape, relative to the first quantile
    QuantileTable normalised_burden_baseline{};
};

/// @brief Implements the attributable fraction calculations
///
/// @details Quantiles are equally weighted representative points of the
/// exposure distribution, sums along the quantiles axis approximate the
/// integral over the distribution.
class AttributableFractionEngine {
  public:
    /// @brief Computes every attributable fraction result of a disease
    /// @param baseline The baseline relative risk quantiles
    /// @param scenario The scenario relative risk quantiles
    /// @return The disease results
    /// @throws core::InputFormatError for tables with different shapes
    DiseaseRiskResult compute(const QuantileTable &baseline, const QuantileTable &scenario) const;

    /// @brief Computes the attributable fraction, <c>1 - sum(RR_s) / sum(RR_b)</c>
    /// @param scenario The scenario relative risk quantiles
    /// @param baseline The baseline relative risk quantiles
    /// @return The stratified attributable fraction
    /// @throws core::InputFormatError for tables with different shapes
    static DoubleAgeSexTable attributable_fraction(const QuantileTable &scenario,
                                                   const QuantileTable &baseline);

    /// @brief Computes the alternative attributable fraction, <c>(sum(s) - sum(b)) / sum(s)</c>
    /// @param scenario The scenario quantiles
    /// @param baseline The baseline quantiles
    /// @return The stratified attributable fraction
    /// @throws core::InputFormatError for tables with different shapes
    static DoubleAgeSexTable alternative_attributable_fraction(const QuantileTable &scenario,
                                                               const QuantileTable &baseline);

    /// @brief Computes the element-wise ratio of two tables
    /// @param numerator The numerator table
    /// @param denominator The denominator table
    /// @return The ratio table
    /// @throws core::InputFormatError for tables with different shapes
    static QuantileTable ratio(const QuantileTable &numerator, const QuantileTable &denominator);

    /// @brief Divides every quantile by the stratum first quantile
    /// @param relative_risk The relative risk quantiles
    /// @return The normalised burden shape, first quantile equals one
    static QuantileTable normalise_disease_burden(const QuantileTable &relative_risk);
};
} // namespace ithim
