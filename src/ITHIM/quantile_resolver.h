#pragma once

#include "age_sex_table.h"
#include "exposure_means.h"
#include "model_options.h"
#include "monotonic_vector.h"
#include "quantile_table.h"

#include <vector>

namespace ithim {

/// @brief Defines the lognormal distribution log-scale parameters
struct LognormalParameters {
    /// @brief Mean of the logarithm
    double location{};

    /// @brief Standard deviation of the logarithm
    double scale{};
};

/// @brief Defines the active transport time quantiles data type
struct TravelTimeQuantiles {
    /// @brief Active transport time quantiles, minutes per week
    QuantileTable active_transport_time{};

    /// @brief Walking share of the active transport time quantiles
    QuantileTable walking_time{};

    /// @brief Cycling share of the active transport time quantiles
    QuantileTable cycling_time{};
};

/// @brief Implements the lognormal moment matching and quantile extraction
///
/// @details Means at or below zero are replaced by the options mean floor
/// before the log transform; the standard deviation is kept.
class QuantileResolver {
  public:
    /// @brief Initialises a new instance of the QuantileResolver class
    /// @param options The model options
    explicit QuantileResolver(const ModelOptions &options);

    /// @brief Fits a lognormal distribution to a mean and standard deviation
    /// @param mean The distribution mean
    /// @param standard_deviation The distribution standard deviation
    /// @return The lognormal log-scale parameters
    /// @throws core::NumericDomainError for negative standard deviation
    LognormalParameters fit(double mean, double standard_deviation) const;

    /// @brief Computes the lognormal quantiles of every stratum
    /// @param mean The stratum means
    /// @param standard_deviation The stratum standard deviations
    /// @param quantiles The quantile probabilities
    /// @return The stratum by quantile table
    /// @throws core::InputFormatError for mean and standard deviation strata mismatch
    QuantileTable resolve(const DoubleAgeSexTable &mean,
                          const DoubleAgeSexTable &standard_deviation,
                          const MonotonicVector<double> &quantiles) const;

    /// @brief Computes the active transport time quantiles and its walking, cycling split
    /// @param means The stratum exposure means
    /// @param quantiles The quantile probabilities
    /// @return The travel time quantiles
    TravelTimeQuantiles resolve_travel_time(const ExposureMeans &means,
                                            const MonotonicVector<double> &quantiles) const;

    /// @brief Evaluates the fitted lognormal density on an evenly spaced grid
    /// @param mean The distribution mean
    /// @param standard_deviation The distribution standard deviation
    /// @param upper_bound The grid upper bound, the lower bound is zero
    /// @param points The number of grid points
    /// @return The density values
    std::vector<double> density(double mean, double standard_deviation, double upper_bound = 2000.0,
                                std::size_t points = 1000) const;

  private:
    double mean_floor_;
};
} // namespace ithim
