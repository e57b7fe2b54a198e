#include "met_exposure.h"

#include "mtrandom.h"
#include "random_algorithm.h"
#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/math_util.h"
#include "ITHIM.Core/thread_util.h"

#include <algorithm>
#include <fmt/format.h>
#include <utility>

namespace ithim {

METExposureSimulator::METExposureSimulator(const ModelOptions &options)
    : options_{options}, resolver_{options} {
    if (options_.sample_size < 1) {
        throw core::NumericDomainError("The Monte-Carlo sample size must be greater than zero.");
    }
}

double METExposureSimulator::travel_met(double travel_time,
                                        double walking_proportion) const noexcept {
    auto walking = travel_time * walking_proportion / 60.0 * options_.walking_met;
    auto cycling = travel_time * (1.0 - walking_proportion) / 60.0 * options_.cycling_met;
    return walking + cycling;
}

std::vector<double> METExposureSimulator::sample(const StratumExposure &exposure,
                                                 RandomBitGenerator &generator) const {
    auto travel = fit_floored(exposure.travel_mean, exposure.travel_cv);
    auto non_travel = fit_floored(exposure.non_travel_mean, exposure.non_travel_cv);

    auto rnd = Random{generator};
    auto result = std::vector<double>(options_.sample_size);
    for (auto &value : result) {
        value = travel_met(rnd.next_lognormal(travel.location, travel.scale),
                           exposure.walking_proportion);
    }

    for (auto &value : result) {
        value += rnd.next_lognormal(non_travel.location, non_travel.scale);
    }

    return result;
}

QuantileTable METExposureSimulator::simulate(const ExposureMeans &means, double travel_cv,
                                             double non_travel_cv,
                                             const MonotonicVector<double> &quantiles,
                                             RandomBitGenerator &generator) const {
    const auto &age_classes = means.active_transport_time.age_classes();
    auto strata = std::vector<std::pair<int, core::Gender>>{};
    for (const auto &age_class : age_classes) {
        for (const auto &gender : stratum_genders) {
            strata.emplace_back(age_class, gender);
        }
    }

    auto result = QuantileTable(MonotonicVector<int>(age_classes), quantiles);
    if (strata.empty()) {
        return result;
    }

    auto seeds = std::vector<unsigned int>(strata.size());
    for (auto &seed : seeds) {
        seed = generator();
    }

    auto stratum_quantiles = std::vector<std::vector<double>>(strata.size());
    core::parallel_for(std::size_t{0}, strata.size() - 1, [&](std::size_t index) {
        const auto &[age_class, gender] = strata[index];
        auto exposure = StratumExposure{
            .travel_mean = means.active_transport_time.at(age_class, gender),
            .travel_cv = travel_cv,
            .non_travel_mean = means.non_travel.at(age_class, gender),
            .non_travel_cv = non_travel_cv,
            .walking_proportion = means.walking_proportion.at(age_class, gender)};

        auto engine = MTRandom32{seeds[index]};
        auto values = sample(exposure, engine);
        std::sort(values.begin(), values.end());

        auto &output = stratum_quantiles[index];
        output.reserve(quantiles.size());
        for (const auto &probability : quantiles) {
            output.emplace_back(std::max(
                core::MathHelper::empirical_quantile(values, probability), options_.met_floor));
        }
    });

    for (std::size_t index = 0; index < strata.size(); index++) {
        const auto &[age_class, gender] = strata[index];
        for (std::size_t q = 0; q < quantiles.size(); q++) {
            result.at(age_class, gender, q) = stratum_quantiles[index][q];
        }
    }

    return result;
}

LognormalParameters METExposureSimulator::fit_floored(double mean, double cv) const {
    if (mean <= 0.0) {
        mean = options_.mean_floor;
    }

    return resolver_.fit(mean, mean * cv);
}
} // namespace ithim
