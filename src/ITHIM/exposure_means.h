#pragma once

#include "age_sex_table.h"
#include "model_parameters.h"

namespace ithim {

/// @brief Defines the per-stratum exposure means data type
struct ExposureMeans {
    /// @brief Mean walking time, minutes per week
    DoubleAgeSexTable walking_time{};

    /// @brief Mean cycling time, minutes per week
    DoubleAgeSexTable cycling_time{};

    /// @brief Mean non-travel activity, MET-hours per week
    DoubleAgeSexTable non_travel{};

    /// @brief Mean active transport time, walking plus cycling
    DoubleAgeSexTable active_transport_time{};

    /// @brief Standard deviation of active transport time
    DoubleAgeSexTable active_transport_sd{};

    /// @brief Proportion of active transport time spent cycling
    DoubleAgeSexTable cycling_proportion{};

    /// @brief Proportion of active transport time spent walking
    DoubleAgeSexTable walking_proportion{};
};

/// @brief Implements the stratum exposure means model
///
/// @details Converts relative stratum weights and population means into
/// per-stratum means. With MeanType::overall, each mean is the population
/// mean scaled by the stratum weight over the population-weighted average
/// weight, <c>mu * R / sum(F * R)</c>; with MeanType::referent, the mean is
/// simply <c>mu * R</c>.
class ExposureMeansModel {
  public:
    /// @brief Computes the stratum means of a set of parameters
    /// @param parameters The validated model parameters
    /// @return The stratum exposure means
    ExposureMeans compute(const ModelParameters &parameters) const;

    /// @brief Computes the stratum means of one activity
    /// @param population_mean The population mean
    /// @param weights The relative stratum weights
    /// @param population_share The population share of each stratum
    /// @param type The normalisation mode
    /// @return The stratum means
    static DoubleAgeSexTable stratum_means(double population_mean,
                                           const DoubleAgeSexTable &weights,
                                           const DoubleAgeSexTable &population_share,
                                           MeanType type);
};
} // namespace ithim
