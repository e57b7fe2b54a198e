#pragma once

#include "exposure_means.h"
#include "model_options.h"
#include "model_parameters.h"
#include "quantile_table.h"
#include "randombit_generator.h"

namespace ithim {

/// @brief Defines the exposure quantiles of a population
struct ExposureQuantiles {
    /// @brief Active transport time quantiles, minutes per week
    QuantileTable active_transport_time{};

    /// @brief Walking time quantiles, minutes per week
    QuantileTable walking_time{};

    /// @brief Cycling time quantiles, minutes per week
    QuantileTable cycling_time{};

    /// @brief Total MET exposure quantiles, MET-hours per week
    QuantileTable total_met{};
};

/// @brief Defines the physical activity model of a population
///
/// @details An immutable bundle of parameters with the exposure means and
/// quantiles computed from them at construction. Scenarios are created with
/// with_parameters, which leaves the original model untouched.
class Model {
  public:
    Model() = delete;

    /// @brief Initialises a new instance of the Model class
    /// @param parameters The model parameters
    /// @param options The model options, the seed sets the Monte-Carlo generator
    /// @throws core::InputFormatError for inconsistent parameters
    /// @throws core::NumericDomainError for parameter values outside of their domain
    explicit Model(ModelParameters parameters, ModelOptions options = {});

    /// @brief Initialises a new instance of the Model class with an external generator
    /// @param parameters The model parameters
    /// @param options The model options, the seed is ignored
    /// @param generator The Monte-Carlo seed source
    /// @throws core::InputFormatError for inconsistent parameters
    /// @throws core::NumericDomainError for parameter values outside of their domain
    Model(ModelParameters parameters, ModelOptions options, RandomBitGenerator &generator);

    /// @brief Gets the model parameters
    /// @return The model parameters
    const ModelParameters &parameters() const noexcept;

    /// @brief Gets the model options
    /// @return The model options
    const ModelOptions &options() const noexcept;

    /// @brief Gets the stratum exposure means
    /// @return The exposure means
    const ExposureMeans &means() const noexcept;

    /// @brief Gets the exposure quantiles
    /// @return The exposure quantiles
    const ExposureQuantiles &quantiles() const noexcept;

    /// @brief Creates a new model with different parameters and the same options
    /// @param parameters The new model parameters
    /// @return The new model instance
    Model with_parameters(ModelParameters parameters) const;

    /// @brief Creates a new model with different parameters and an external generator
    /// @param parameters The new model parameters
    /// @param generator The Monte-Carlo seed source
    /// @return The new model instance
    Model with_parameters(ModelParameters parameters, RandomBitGenerator &generator) const;

  private:
    ModelParameters parameters_;
    ModelOptions options_;
    ExposureMeans means_;
    ExposureQuantiles quantiles_;

    void initialise(RandomBitGenerator &generator);
};
} // namespace ithim
