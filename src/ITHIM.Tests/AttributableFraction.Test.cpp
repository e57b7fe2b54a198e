#include "pch.h"
#include "test_data.h"

#include "ITHIM/attributable_fraction.h"
#include "ITHIM/burden_aggregator.h"

namespace {
ithim::QuantileTable create_risk(double first, double step) {
    using namespace ithim;

    auto table = QuantileTable(MonotonicVector<int>(test_data::age_classes),
                               MonotonicVector<double>(default_quantiles));
    return transform_quantiles(table, [first, step](int age, core::Gender gender, std::size_t q,
                                                    double) {
        auto offset = gender == core::Gender::male ? 0.0 : 0.01;
        return first - step * static_cast<double>(q) - 0.001 * age - offset;
    });
}
} // namespace

TEST(TestITHIM_AttributableFraction, IdenticalRiskHasZeroFraction) {
    using namespace ithim;

    auto risk = create_risk(0.95, 0.05);
    auto result = AttributableFractionEngine{}.compute(risk, risk);

    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            ASSERT_EQ(0.0, result.attributable_fraction.at(age_class, gender));
            ASSERT_EQ(0.0, result.alternative_attributable_fraction.at(age_class, gender));
            for (std::size_t q = 0; q < default_quantiles.size(); q++) {
                ASSERT_EQ(1.0, result.normalised_to_baseline.at(age_class, gender, q));
            }
        }
    }
}

TEST(TestITHIM_AttributableFraction, LowerScenarioRiskIsPositiveFraction) {
    using namespace ithim;

    auto baseline = create_risk(0.95, 0.05);
    auto scenario = create_risk(0.90, 0.06);
    auto fraction = AttributableFractionEngine::attributable_fraction(scenario, baseline);

    auto expected = 1.0 - scenario.row_sum(3, core::Gender::female) /
                              baseline.row_sum(3, core::Gender::female);
    ASSERT_DOUBLE_EQ(expected, fraction.at(3, core::Gender::female));
    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            ASSERT_LT(0.0, fraction.at(age_class, gender));
            ASSERT_GT(1.0, fraction.at(age_class, gender));
        }
    }
}

TEST(TestITHIM_AttributableFraction, AlternativeFractionOnNormalisedRatios) {
    using namespace ithim;

    auto baseline = create_risk(0.95, 0.05);
    auto scenario = create_risk(0.90, 0.06);
    auto result = AttributableFractionEngine{}.compute(baseline, scenario);

    auto ratio_sum = result.normalised_to_baseline.row_sum(2, core::Gender::male);
    auto identity_sum = static_cast<double>(default_quantiles.size());
    ASSERT_NEAR((ratio_sum - identity_sum) / ratio_sum,
                result.alternative_attributable_fraction.at(2, core::Gender::male), 1e-12);
    ASSERT_NEAR(baseline.at(2, core::Gender::male, 1) / scenario.at(2, core::Gender::male, 1),
                result.normalised_to_baseline.at(2, core::Gender::male, 1), 1e-12);
}

TEST(TestITHIM_AttributableFraction, NormalisedBurdenFirstQuantileIsOne) {
    using namespace ithim;

    auto risk = create_risk(0.83, 0.07);
    auto normalised = AttributableFractionEngine::normalise_disease_burden(risk);

    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            ASSERT_EQ(1.0, normalised.at(age_class, gender, 0));
            ASSERT_DOUBLE_EQ(risk.at(age_class, gender, 3) / risk.at(age_class, gender, 0),
                             normalised.at(age_class, gender, 3));
        }
    }
}

TEST(TestITHIM_AttributableFraction, ShapeMismatchThrows) {
    using namespace ithim;

    auto baseline = create_risk(0.95, 0.05);
    auto other = QuantileTable(MonotonicVector<int>(test_data::age_classes),
                               MonotonicVector<double>({0.25, 0.5, 0.75}));

    ASSERT_THROW(AttributableFractionEngine::attributable_fraction(other, baseline),
                 core::InputFormatError);
    ASSERT_THROW(AttributableFractionEngine{}.compute(baseline, other), core::InputFormatError);
}

TEST(TestITHIM_BurdenAggregator, AllocatePreservesStratumTotals) {
    using namespace ithim;

    auto burden = test_data::create_burden();
    auto shape = AttributableFractionEngine::normalise_disease_burden(create_risk(0.9, 0.05));
    const auto &deaths = burden.at(DiseaseType::cvd, BurdenType::deaths);

    auto allocated = BurdenAggregator::allocate(deaths, shape);
    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            ASSERT_NEAR(deaths.at(age_class, gender), allocated.row_sum(age_class, gender), 1e-9);
            ASSERT_LT(allocated.at(age_class, gender, 1), allocated.at(age_class, gender, 0));
        }
    }
}

TEST(TestITHIM_BurdenAggregator, DeltaScalesBurdenByFraction) {
    using namespace ithim;

    auto burden = test_data::create_burden();
    auto risk = AttributableFractionEngine{}.compute(create_risk(0.95, 0.05),
                                                     create_risk(0.90, 0.06));
    auto aggregator = BurdenAggregator{burden};

    auto delta = aggregator.delta(DiseaseType::diabetes, BurdenType::daly, risk);
    for (const auto &age_class : test_data::age_classes) {
        for (const auto &gender : stratum_genders) {
            auto gbd = burden.at(DiseaseType::diabetes, BurdenType::daly, age_class, gender);
            auto af = risk.attributable_fraction.at(age_class, gender);
            ASSERT_NEAR(-af * gbd, delta.at(age_class, gender), 1e-9);
            ASSERT_GT(0.0, delta.at(age_class, gender));
        }
    }

    auto all = aggregator.delta(DiseaseType::diabetes, risk);
    ASSERT_EQ(all_burden_types.size(), all.size());
    ASSERT_EQ(delta, all.at(BurdenType::daly));
}

TEST(TestITHIM_BurdenAggregator, IdenticalRiskHasZeroDelta) {
    using namespace ithim;

    auto burden = test_data::create_burden();
    auto risk_table = create_risk(0.95, 0.05);
    auto risk = AttributableFractionEngine{}.compute(risk_table, risk_table);
    auto aggregator = BurdenAggregator{burden};

    for (const auto &[type, delta] : aggregator.delta(DiseaseType::cvd, risk)) {
        ASSERT_EQ(0.0, delta.sum()) << to_string(type);
    }
}
