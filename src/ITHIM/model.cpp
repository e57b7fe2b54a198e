#include "model.h"

#include "met_exposure.h"
#include "mtrandom.h"
#include "quantile_resolver.h"
#include "ITHIM.Core/scoped_timer.h"

#include <utility>

namespace ithim {

Model::Model(ModelParameters parameters, ModelOptions options)
    : parameters_{std::move(parameters)}, options_{std::move(options)} {
    if (options_.seed.has_value()) {
        auto generator = MTRandom32{options_.seed.value()};
        initialise(generator);
    } else {
        auto generator = MTRandom32{};
        initialise(generator);
    }
}

Model::Model(ModelParameters parameters, ModelOptions options, RandomBitGenerator &generator)
    : parameters_{std::move(parameters)}, options_{std::move(options)} {
    initialise(generator);
}

const ModelParameters &Model::parameters() const noexcept { return parameters_; }

const ModelOptions &Model::options() const noexcept { return options_; }

const ExposureMeans &Model::means() const noexcept { return means_; }

const ExposureQuantiles &Model::quantiles() const noexcept { return quantiles_; }

Model Model::with_parameters(ModelParameters parameters) const {
    return Model{std::move(parameters), options_};
}

Model Model::with_parameters(ModelParameters parameters, RandomBitGenerator &generator) const {
    return Model{std::move(parameters), options_, generator};
}

void Model::initialise(RandomBitGenerator &generator) {
#if ITHIM_USE_TIMER
    auto timer = core::ScopedTimer("Model::initialise");
#endif

    parameters_.validate();
    auto probabilities = MonotonicVector<double>(parameters_.quantiles);

    means_ = ExposureMeansModel{}.compute(parameters_);

    auto travel = QuantileResolver{options_}.resolve_travel_time(means_, probabilities);
    auto total_met = METExposureSimulator{options_}.simulate(
        means_, parameters_.travel_cv, parameters_.non_travel_cv, probabilities, generator);

    quantiles_ = ExposureQuantiles{.active_transport_time = std::move(travel.active_transport_time),
                                   .walking_time = std::move(travel.walking_time),
                                   .cycling_time = std::move(travel.cycling_time),
                                   .total_met = std::move(total_met)};
}
} // namespace ithim
