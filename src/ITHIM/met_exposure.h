#pragma once

#include "exposure_means.h"
#include "model_options.h"
#include "monotonic_vector.h"
#include "quantile_resolver.h"
#include "quantile_table.h"
#include "randombit_generator.h"

#include <vector>

namespace ithim {

/// @brief Defines the exposure distribution parameters of one stratum
struct StratumExposure {
    /// @brief Mean active transport time, minutes per week
    double travel_mean{};

    /// @brief Active transport time coefficient of variation
    double travel_cv{};

    /// @brief Mean non-travel activity, MET-hours per week
    double non_travel_mean{};

    /// @brief Non-travel activity coefficient of variation
    double non_travel_cv{};

    /// @brief Proportion of active transport time spent walking
    double walking_proportion{1.0};
};

/// @brief Implements the Monte-Carlo total MET exposure simulator
///
/// @details The total exposure is the sum of two independent lognormal
/// variables, active transport MET and non-travel MET, which has no closed
/// form. Each stratum is sampled with its own generator, seeded in stratum
/// order from the caller's generator, so results do not depend on the
/// number of worker threads.
class METExposureSimulator {
  public:
    /// @brief Initialises a new instance of the METExposureSimulator class
    /// @param options The model options
    /// @throws core::NumericDomainError for zero sample size
    explicit METExposureSimulator(const ModelOptions &options);

    /// @brief Converts an active transport time into MET-hours
    /// @param travel_time The active transport time, minutes per week
    /// @param walking_proportion The proportion of time spent walking
    /// @return The active transport MET-hours per week
    double travel_met(double travel_time, double walking_proportion) const noexcept;

    /// @brief Draws a total MET exposure sample for one stratum
    /// @param exposure The stratum exposure parameters
    /// @param generator The random number generator to draw from
    /// @return The sample values, in draw order
    std::vector<double> sample(const StratumExposure &exposure,
                               RandomBitGenerator &generator) const;

    /// @brief Simulates the total MET exposure quantiles of every stratum
    /// @param means The stratum exposure means
    /// @param travel_cv Active transport time coefficient of variation
    /// @param non_travel_cv Non-travel activity coefficient of variation
    /// @param quantiles The quantile probabilities
    /// @param generator The seed source for the strata generators
    /// @return The total MET quantiles, floored at the options MET floor
    QuantileTable simulate(const ExposureMeans &means, double travel_cv, double non_travel_cv,
                           const MonotonicVector<double> &quantiles,
                           RandomBitGenerator &generator) const;

  private:
    ModelOptions options_;
    QuantileResolver resolver_;

    LognormalParameters fit_floored(double mean, double cv) const;
};
} // namespace ithim
