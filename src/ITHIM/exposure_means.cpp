#include "exposure_means.h"

#include "ITHIM.Core/exception.h"

#include <fmt/format.h>

namespace ithim {

ExposureMeans ExposureMeansModel::compute(const ModelParameters &parameters) const {
    auto walking = stratum_means(parameters.mean_walking_time, parameters.walking_weights,
                                 parameters.population_share, parameters.mean_type);
    auto cycling = stratum_means(parameters.mean_cycling_time, parameters.cycling_weights,
                                 parameters.population_share, parameters.mean_type);
    auto non_travel = stratum_means(parameters.mean_non_travel, parameters.non_travel_weights,
                                    parameters.population_share, parameters.mean_type);

    auto active_transport =
        combine_strata(walking, cycling, [](double walk, double cycle) { return walk + cycle; });

    auto travel_cv = parameters.travel_cv;
    auto active_transport_sd = transform_strata(
        active_transport, [travel_cv](int, core::Gender, double mean) { return mean * travel_cv; });

    // Strata without active travel are assigned to walking
    auto cycling_proportion = combine_strata(cycling, walking, [](double cycle, double walk) {
        auto total = cycle + walk;
        return total > 0.0 ? cycle / total : 0.0;
    });

    auto walking_proportion = transform_strata(
        cycling_proportion, [](int, core::Gender, double proportion) { return 1.0 - proportion; });

    return ExposureMeans{.walking_time = std::move(walking),
                         .cycling_time = std::move(cycling),
                         .non_travel = std::move(non_travel),
                         .active_transport_time = std::move(active_transport),
                         .active_transport_sd = std::move(active_transport_sd),
                         .cycling_proportion = std::move(cycling_proportion),
                         .walking_proportion = std::move(walking_proportion)};
}

DoubleAgeSexTable ExposureMeansModel::stratum_means(double population_mean,
                                                    const DoubleAgeSexTable &weights,
                                                    const DoubleAgeSexTable &population_share,
                                                    MeanType type) {
    switch (type) {
    case MeanType::overall: {
        auto weighted = combine_strata(population_share, weights,
                                       [](double share, double weight) { return share * weight; });
        auto average_weight = weighted.sum();
        if (average_weight <= 0.0) {
            if (population_mean > 0.0) {
                throw core::NumericDomainError(fmt::format(
                    "Population weighted average weight is zero for a mean of {}.",
                    population_mean));
            }

            return DoubleAgeSexTable(MonotonicVector<int>(weights.age_classes()), 0.0);
        }

        auto scale = population_mean / average_weight;
        return transform_strata(
            weights, [scale](int, core::Gender, double weight) { return scale * weight; });
    }
    case MeanType::referent:
        return transform_strata(weights, [population_mean](int, core::Gender, double weight) {
            return population_mean * weight;
        });
    }

    throw core::ConfigurationError(
        fmt::format("Unknown mean type value: {}", static_cast<int>(type)));
}
} // namespace ithim
