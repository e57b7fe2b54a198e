#pragma once

#include "age_sex_table.h"
#include "attributable_fraction.h"
#include "disease.h"
#include "disease_burden.h"
#include "quantile_table.h"

#include <functional>
#include <map>

namespace ithim {

/// @brief Implements the burden of disease aggregation
///
/// @details The stratum burden is redistributed across the exposure quantiles
/// proportionally to the normalised relative risk shape, then recombined.
/// The scenario path scales the baseline burden by <c>1 - AF</c>.
class BurdenAggregator {
  public:
    BurdenAggregator() = delete;

    /// @brief Initialises a new instance of the BurdenAggregator class
    /// @param burden The baseline disease burden table, must outlive this instance
    explicit BurdenAggregator(const DiseaseBurdenTable &burden);

    /// @brief Distributes a stratified burden across quantiles by a shape
    /// @param burden The stratified burden
    /// @param shape The normalised burden shape
    /// @return The burden by stratum and quantile
    /// @throws core::InputFormatError for burden and shape age classes mismatch
    static QuantileTable allocate(const DoubleAgeSexTable &burden, const QuantileTable &shape);

    /// @brief Computes the scenario burden of a disease
    /// @param disease The disease type
    /// @param burden The burden type
    /// @param risk The disease attributable fraction results
    /// @return The stratified scenario burden
    /// @throws core::MissingBurdenDataError for missing disease burden data
    DoubleAgeSexTable scenario_burden(DiseaseType disease, BurdenType burden,
                                      const DiseaseRiskResult &risk) const;

    /// @brief Computes the baseline burden of a disease
    /// @param disease The disease type
    /// @param burden The burden type
    /// @param risk The disease attributable fraction results
    /// @return The stratified baseline burden
    /// @throws core::MissingBurdenDataError for missing disease burden data
    DoubleAgeSexTable baseline_burden(DiseaseType disease, BurdenType burden,
                                      const DiseaseRiskResult &risk) const;

    /// @brief Computes the scenario minus baseline burden of a disease
    /// @param disease The disease type
    /// @param burden The burden type
    /// @param risk The disease attributable fraction results
    /// @return The stratified burden delta
    /// @throws core::MissingBurdenDataError for missing disease burden data
    DoubleAgeSexTable delta(DiseaseType disease, BurdenType burden,
                            const DiseaseRiskResult &risk) const;

    /// @brief Computes the burden delta of a disease for all burden types
    /// @param disease The disease type
    /// @param risk The disease attributable fraction results
    /// @return The stratified burden delta by burden type
    std::map<BurdenType, DoubleAgeSexTable> delta(DiseaseType disease,
                                                  const DiseaseRiskResult &risk) const;

  private:
    std::reference_wrapper<const DiseaseBurdenTable> burden_;
};
} // namespace ithim
