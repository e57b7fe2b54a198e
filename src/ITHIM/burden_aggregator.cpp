#include "burden_aggregator.h"

#include "ITHIM.Core/exception.h"

namespace ithim {

BurdenAggregator::BurdenAggregator(const DiseaseBurdenTable &burden) : burden_{burden} {}

QuantileTable BurdenAggregator::allocate(const DoubleAgeSexTable &burden,
                                         const QuantileTable &shape) {
    if (burden.age_classes() != shape.age_classes()) {
        throw core::InputFormatError("Burden and relative risk shape age classes mismatch.");
    }

    auto totals = shape.row_sums();
    return transform_quantiles(shape, [&](int age_class, core::Gender gender, std::size_t,
                                          double weight) {
        return burden.at(age_class, gender) / totals.at(age_class, gender) * weight;
    });
}

DoubleAgeSexTable BurdenAggregator::scenario_burden(DiseaseType disease, BurdenType burden,
                                                    const DiseaseRiskResult &risk) const {
    auto scaled = combine_strata(burden_.get().at(disease, burden), risk.attributable_fraction,
                                 [](double value, double af) { return value * (1.0 - af); });

    return allocate(scaled, risk.normalised_burden).row_sums();
}

DoubleAgeSexTable BurdenAggregator::baseline_burden(DiseaseType disease, BurdenType burden,
                                                    const DiseaseRiskResult &risk) const {
    return allocate(burden_.get().at(disease, burden), risk.normalised_burden_baseline).row_sums();
}

DoubleAgeSexTable BurdenAggregator::delta(DiseaseType disease, BurdenType burden,
                                          const DiseaseRiskResult &risk) const {
    return combine_strata(scenario_burden(disease, burden, risk),
                          baseline_burden(disease, burden, risk),
                          [](double scenario, double baseline) { return scenario - baseline; });
}

std::map<BurdenType, DoubleAgeSexTable> BurdenAggregator::delta(DiseaseType disease,
                                                                const DiseaseRiskResult &risk) const {
    auto result = std::map<BurdenType, DoubleAgeSexTable>{};
    for (const auto &burden : all_burden_types) {
        result.emplace(burden, delta(disease, burden, risk));
    }

    return result;
}
} // namespace ithim
