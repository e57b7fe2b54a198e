#include "pch.h"
#include "test_data.h"

#include "ITHIM/exposure_means.h"
#include "ITHIM/mtrandom.h"
#include "ITHIM/quantile_resolver.h"
#include "ITHIM/random_algorithm.h"

#include <cmath>

TEST(TestITHIM_ExposureMeans, OverallMeanIsPopulationWeightedAverage) {
    using namespace ithim;

    auto parameters = test_data::create_parameters(100.0, 20.0);
    auto means = ExposureMeansModel{}.compute(parameters);

    auto weighted_walking = combine_strata(parameters.population_share, means.walking_time,
                                           [](double share, double mean) { return share * mean; });
    auto weighted_cycling = combine_strata(parameters.population_share, means.cycling_time,
                                           [](double share, double mean) { return share * mean; });

    ASSERT_NEAR(100.0, weighted_walking.sum(), 1e-9);
    ASSERT_NEAR(20.0, weighted_cycling.sum(), 1e-9);
    ASSERT_NEAR(2.0, means.non_travel.at(4, core::Gender::female), 1e-9);
}

TEST(TestITHIM_ExposureMeans, ReferentMeanScalesWeights) {
    using namespace ithim;

    auto weights = test_data::create_table({1.0, 2.0, 1.0, 1.0, 1.0, 1.0, 1.0, 0.5},
                                           {1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0});
    auto share = test_data::create_constant_table(1.0 / 16.0);

    auto means = ExposureMeansModel::stratum_means(30.0, weights, share, MeanType::referent);

    ASSERT_DOUBLE_EQ(60.0, means.at(2, core::Gender::male));
    ASSERT_DOUBLE_EQ(15.0, means.at(8, core::Gender::male));
    ASSERT_DOUBLE_EQ(30.0, means.at(8, core::Gender::female));
}

TEST(TestITHIM_ExposureMeans, ZeroWeightsWithZeroMean) {
    using namespace ithim;

    auto weights = test_data::create_constant_table(0.0);
    auto share = test_data::create_constant_table(1.0 / 16.0);

    auto means = ExposureMeansModel::stratum_means(0.0, weights, share, MeanType::overall);
    ASSERT_DOUBLE_EQ(0.0, means.sum());

    ASSERT_THROW(ExposureMeansModel::stratum_means(10.0, weights, share, MeanType::overall),
                 core::NumericDomainError);
}

TEST(TestITHIM_ExposureMeans, ActiveTransportProportions) {
    using namespace ithim;

    auto parameters = test_data::create_parameters();
    auto means = ExposureMeansModel{}.compute(parameters);

    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            auto walking = means.walking_time.at(age_class, gender);
            auto cycling = means.cycling_time.at(age_class, gender);
            auto total = means.active_transport_time.at(age_class, gender);
            ASSERT_NEAR(walking + cycling, total, 1e-12);
            ASSERT_NEAR(cycling / total, means.cycling_proportion.at(age_class, gender), 1e-12);
            ASSERT_NEAR(1.0, means.cycling_proportion.at(age_class, gender) +
                                 means.walking_proportion.at(age_class, gender),
                        1e-12);
            ASSERT_NEAR(total * parameters.travel_cv,
                        means.active_transport_sd.at(age_class, gender), 1e-12);
        }
    }
}

TEST(TestITHIM_ExposureMeans, NoActiveTravelIsAssignedToWalking) {
    using namespace ithim;

    auto parameters = test_data::create_parameters(0.0, 0.0);
    auto means = ExposureMeansModel{}.compute(parameters);

    ASSERT_DOUBLE_EQ(0.0, means.cycling_proportion.sum());
    ASSERT_DOUBLE_EQ(1.0, means.walking_proportion.at(1, core::Gender::male));
}

TEST(TestITHIM_QuantileResolver, FitMatchesMoments) {
    using namespace ithim;

    auto resolver = QuantileResolver{ModelOptions{}};
    auto params = resolver.fit(50.0, 100.0);

    auto mean = std::exp(params.location + params.scale * params.scale / 2.0);
    auto variance = (std::exp(params.scale * params.scale) - 1.0) *
                    std::exp(2.0 * params.location + params.scale * params.scale);
    ASSERT_NEAR(50.0, mean, 1e-9);
    ASSERT_NEAR(100.0, std::sqrt(variance), 1e-9);
}

TEST(TestITHIM_QuantileResolver, FitFloorsNonPositiveMean) {
    using namespace ithim;

    auto resolver = QuantileResolver{ModelOptions{}};
    auto floored = resolver.fit(0.0, 0.0);

    ASSERT_NEAR(std::log(0.01), floored.location, 1e-12);
    ASSERT_DOUBLE_EQ(0.0, floored.scale);
    ASSERT_THROW(resolver.fit(10.0, -1.0), core::NumericDomainError);

    auto options = ModelOptions{};
    options.mean_floor = 0.0;
    ASSERT_THROW(QuantileResolver{options}, core::NumericDomainError);
}

TEST(TestITHIM_QuantileResolver, ResampledMeanRoundTrip) {
    using namespace ithim;

    auto resolver = QuantileResolver{ModelOptions{}};
    auto params = resolver.fit(120.0, 120.0 * 1.5);

    auto generator = MTRandom32{123u};
    auto rnd = Random{generator};
    constexpr auto sample_size = 1000000;
    auto sum = 0.0;
    for (auto i = 0; i < sample_size; i++) {
        sum += rnd.next_lognormal(params.location, params.scale);
    }

    auto sample_mean = sum / sample_size;
    ASSERT_NEAR(120.0, sample_mean, 120.0 * 0.01);
}

TEST(TestITHIM_QuantileResolver, WalkingAndCyclingSplitActiveTransport) {
    using namespace ithim;

    auto parameters = test_data::create_parameters();
    auto means = ExposureMeansModel{}.compute(parameters);
    auto quantiles = MonotonicVector<double>(parameters.quantiles);
    auto travel = QuantileResolver{ModelOptions{}}.resolve_travel_time(means, quantiles);

    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            for (std::size_t q = 0; q < quantiles.size(); q++) {
                auto total = travel.active_transport_time.at(age_class, gender, q);
                ASSERT_NEAR(total, travel.walking_time.at(age_class, gender, q) +
                                       travel.cycling_time.at(age_class, gender, q),
                            1e-9);
                if (q > 0) {
                    ASSERT_LT(travel.active_transport_time.at(age_class, gender, q - 1), total);
                }
            }
        }
    }
}

TEST(TestITHIM_QuantileResolver, DensityGrid) {
    using namespace ithim;

    auto resolver = QuantileResolver{ModelOptions{}};
    auto density = resolver.density(100.0, 100.0, 2000.0, 1000);

    ASSERT_EQ(1000, density.size());
    ASSERT_DOUBLE_EQ(0.0, density.front());
    for (const auto &value : density) {
        ASSERT_LE(0.0, value);
    }

    ASSERT_THROW(resolver.density(100.0, 100.0, 2000.0, 1), core::NumericDomainError);
}
