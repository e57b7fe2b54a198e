#include "pch.h"
#include "test_data.h"

#include "ITHIM/api.h"

#include <cmath>

namespace {
ithim::Model create_model(double mean_walking_time, double mean_cycling_time) {
    return ithim::Model{test_data::create_parameters(mean_walking_time, mean_cycling_time),
                        test_data::create_options()};
}
} // namespace

TEST(TestITHIM_Model, CreateComputesMeansAndQuantiles) {
    using namespace ithim;

    auto model = create_model(100.0, 20.0);

    ASSERT_EQ(test_data::age_classes, model.quantiles().total_met.age_classes());
    ASSERT_EQ(default_quantiles, model.quantiles().total_met.quantiles());
    ASSERT_EQ(test_data::age_classes, model.means().active_transport_time.age_classes());
    ASSERT_EQ(20000, model.options().sample_size);
    ASSERT_DOUBLE_EQ(20.0, model.parameters().mean_cycling_time);
}

TEST(TestITHIM_Model, WithParametersLeavesOriginalUntouched) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto parameters = baseline.parameters();
    parameters.mean_cycling_time = 40.0;

    auto scenario = baseline.with_parameters(parameters);

    ASSERT_DOUBLE_EQ(20.0, baseline.parameters().mean_cycling_time);
    ASSERT_DOUBLE_EQ(40.0, scenario.parameters().mean_cycling_time);
    ASSERT_EQ(baseline.options().seed, scenario.options().seed);
    ASSERT_LT(baseline.means().cycling_time.sum(), scenario.means().cycling_time.sum());
}

TEST(TestITHIM_Model, InvalidParametersComputeNothing) {
    using namespace ithim;

    auto parameters = test_data::create_parameters();
    parameters.population_share = DoubleAgeSexTable(MonotonicVector<int>({1, 2, 3}), 0.1);

    ASSERT_THROW(Model(parameters, test_data::create_options()), core::InputFormatError);
}

TEST(TestITHIM_ModelComparator, IdenticalModelsHaveZeroDelta) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto scenario = create_model(100.0, 20.0);
    auto report = ModelComparator{}.compare(baseline, scenario);

    for (const auto &disease : report.diseases()) {
        const auto &result = report.at(disease);
        for (const auto &age_class : test_data::age_classes) {
            for (const auto &gender : stratum_genders) {
                ASSERT_EQ(0.0, result.risk.attributable_fraction.at(age_class, gender));
            }
        }
    }

    for (const auto &burden : all_burden_types) {
        ASSERT_EQ(0.0, report.delta_burden(burden));
        ASSERT_EQ(0.0, delta_burden(baseline, scenario, burden));
    }
}

TEST(TestITHIM_ModelComparator, MoreCyclingReducesCardiovascularBurden) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto previous = 0.0;
    for (const auto &cycling : {40.0, 60.0, 80.0}) {
        auto scenario = create_model(100.0, cycling);
        auto delta = delta_burden(baseline, scenario, BurdenType::daly, DiseaseType::cvd);

        ASSERT_GT(0.0, delta);
        ASSERT_LT(std::abs(previous), std::abs(delta));
        previous = delta;
    }
}

TEST(TestITHIM_ModelComparator, AllDiseasesIsSumOfDiseases) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto scenario = create_model(100.0, 40.0);

    for (const auto &burden : all_burden_types) {
        auto sum = 0.0;
        for (const auto &disease : baseline.parameters().burden.diseases()) {
            sum += delta_burden(baseline, scenario, burden, disease);
        }

        auto all = delta_burden(baseline, scenario, burden);
        ASSERT_NEAR(sum, all, 1e-9 * std::abs(sum));
    }
}

TEST(TestITHIM_ModelComparator, ReportMatchesQuerySurface) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto scenario = create_model(100.0, 40.0);
    auto report = ModelComparator{}.compare(baseline, scenario);

    ASSERT_EQ(all_diseases.size(), report.diseases().size());
    ASSERT_DOUBLE_EQ(report.delta_burden(BurdenType::yll, DiseaseType::dementia),
                     delta_burden(baseline, scenario, "yll", "Dementia"));
    ASSERT_DOUBLE_EQ(report.delta_burden(BurdenType::daly),
                     delta_burden(baseline, scenario, "daly", "all"));
}

TEST(TestITHIM_ModelComparator, InjectedDoseResponseModel) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto scenario = create_model(100.0, 40.0);

    auto square_root =
        DoseResponseModel::create_default(MonotonicVector<int>(test_data::age_classes));
    auto fourth_root =
        DoseResponseModel::create_default(MonotonicVector<int>(test_data::age_classes), 0.25);

    auto square_root_delta = ModelComparator{square_root}.compare(baseline, scenario).delta_burden(
        BurdenType::daly, DiseaseType::cvd);
    auto fourth_root_delta = ModelComparator{fourth_root}.compare(baseline, scenario).delta_burden(
        BurdenType::daly, DiseaseType::cvd);

    ASSERT_GT(0.0, square_root_delta);
    ASSERT_GT(0.0, fourth_root_delta);
    ASSERT_NE(square_root_delta, fourth_root_delta);
}

TEST(TestITHIM_ModelComparator, GetBurdenTotals) {
    using namespace ithim;

    auto model = create_model(100.0, 20.0);
    const auto &burden = model.parameters().burden;

    ASSERT_DOUBLE_EQ(burden.total(BurdenType::daly), get_burden(model));
    ASSERT_DOUBLE_EQ(burden.total(BurdenType::deaths, DiseaseType::cvd),
                     get_burden(model, "deaths", "CVD"));
}

TEST(TestITHIM_ModelComparator, InvalidSelectorsThrow) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto scenario = create_model(100.0, 40.0);

    ASSERT_THROW(delta_burden(baseline, scenario, "dalys", "all"), core::ConfigurationError);
    ASSERT_THROW(delta_burden(baseline, scenario, "daly", "Asthma"), core::ConfigurationError);
    ASSERT_THROW(delta_burden(baseline, scenario, "daly", "RTIs"), core::ConfigurationError);
    ASSERT_THROW(get_burden(baseline, "years", "all"), core::ConfigurationError);
}

TEST(TestITHIM_ModelComparator, MissingBurdenDataThrows) {
    using namespace ithim;

    auto parameters = test_data::create_parameters();
    auto burden = DiseaseBurdenTable{};
    for (const auto &type : all_burden_types) {
        burden.add(DiseaseType::cvd, type, parameters.burden.at(DiseaseType::cvd, type));
    }

    parameters.burden = burden;
    auto baseline = Model{parameters, test_data::create_options()};
    parameters.mean_cycling_time = 40.0;
    auto scenario = Model{parameters, test_data::create_options()};

    ASSERT_NO_THROW(delta_burden(baseline, scenario, BurdenType::daly, DiseaseType::cvd));
    ASSERT_THROW(delta_burden(baseline, scenario, BurdenType::daly, DiseaseType::diabetes),
                 core::MissingBurdenDataError);

    auto report = ModelComparator{}.compare(baseline, scenario);
    ASSERT_EQ(1, report.diseases().size());
    ASSERT_THROW(report.at(DiseaseType::dementia), core::MissingBurdenDataError);
}

TEST(TestITHIM_ModelComparator, MismatchedModelsThrow) {
    using namespace ithim;

    auto baseline = create_model(100.0, 20.0);
    auto parameters = test_data::create_parameters(100.0, 40.0);
    parameters.quantiles = {0.2, 0.4, 0.6, 0.8};
    auto scenario = Model{parameters, test_data::create_options()};

    ASSERT_THROW(ModelComparator{}.compare(baseline, scenario), core::InputFormatError);
}
