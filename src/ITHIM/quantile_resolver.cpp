#include "quantile_resolver.h"

#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/math_util.h"

#include <cmath>
#include <fmt/format.h>

namespace ithim {

QuantileResolver::QuantileResolver(const ModelOptions &options) : mean_floor_{options.mean_floor} {
    if (mean_floor_ <= 0.0) {
        throw core::NumericDomainError(
            fmt::format("The mean floor must be positive, given {}.", mean_floor_));
    }
}

LognormalParameters QuantileResolver::fit(double mean, double standard_deviation) const {
    if (standard_deviation < 0.0) {
        throw core::NumericDomainError(
            fmt::format("Negative standard deviation: {}.", standard_deviation));
    }

    if (mean <= 0.0) {
        mean = mean_floor_;
    }

    auto variation = std::log(1.0 + std::pow(standard_deviation / mean, 2));
    return LognormalParameters{.location = std::log(mean) - 0.5 * variation,
                               .scale = std::sqrt(variation)};
}

QuantileTable QuantileResolver::resolve(const DoubleAgeSexTable &mean,
                                        const DoubleAgeSexTable &standard_deviation,
                                        const MonotonicVector<double> &quantiles) const {
    if (!mean.same_strata(standard_deviation)) {
        throw core::InputFormatError("Mean and standard deviation age classes mismatch.");
    }

    auto result = QuantileTable(MonotonicVector<int>(mean.age_classes()), quantiles);
    for (const auto &age_class : mean.age_classes()) {
        for (const auto &gender : stratum_genders) {
            auto params =
                fit(mean.at(age_class, gender), standard_deviation.at(age_class, gender));
            for (std::size_t q = 0; q < quantiles.size(); q++) {
                result.at(age_class, gender, q) = core::MathHelper::lognormal_quantile(
                    quantiles[q], params.location, params.scale);
            }
        }
    }

    return result;
}

TravelTimeQuantiles
QuantileResolver::resolve_travel_time(const ExposureMeans &means,
                                      const MonotonicVector<double> &quantiles) const {
    auto active_transport =
        resolve(means.active_transport_time, means.active_transport_sd, quantiles);

    const auto &proportion = means.cycling_proportion;
    auto walking = transform_quantiles(
        active_transport, [&proportion](int age_class, core::Gender gender, std::size_t, double t) {
            return t * (1.0 - proportion.at(age_class, gender));
        });

    auto cycling = transform_quantiles(
        active_transport, [&proportion](int age_class, core::Gender gender, std::size_t, double t) {
            return t * proportion.at(age_class, gender);
        });

    return TravelTimeQuantiles{.active_transport_time = std::move(active_transport),
                               .walking_time = std::move(walking),
                               .cycling_time = std::move(cycling)};
}

std::vector<double> QuantileResolver::density(double mean, double standard_deviation,
                                              double upper_bound, std::size_t points) const {
    if (points < 2 || upper_bound <= 0.0) {
        throw core::NumericDomainError(
            fmt::format("Invalid density grid: {} points over [0, {}].", points, upper_bound));
    }

    auto params = fit(mean, standard_deviation);
    auto step = upper_bound / static_cast<double>(points - 1);
    auto result = std::vector<double>(points);
    for (std::size_t i = 0; i < points; i++) {
        result[i] = core::MathHelper::lognormal_density(static_cast<double>(i) * step,
                                                        params.location, params.scale);
    }

    return result;
}
} // namespace ithim
