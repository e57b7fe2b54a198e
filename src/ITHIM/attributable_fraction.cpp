#include "attributable_fraction.h"

#include "ITHIM.Core/exception.h"

namespace ithim {

DiseaseRiskResult AttributableFractionEngine::compute(const QuantileTable &baseline,
                                                      const QuantileTable &scenario) const {
    auto normalised = ratio(baseline, scenario);
    auto identity = ratio(baseline, baseline);
    return DiseaseRiskResult{
        .baseline_relative_risk = baseline,
        .scenario_relative_risk = scenario,
        .normalised_to_baseline = normalised,
        .attributable_fraction = attributable_fraction(scenario, baseline),
        .alternative_attributable_fraction = alternative_attributable_fraction(normalised, identity),
        .normalised_burden = normalise_disease_burden(scenario),
        .normalised_burden_baseline = normalise_disease_burden(baseline)};
}

DoubleAgeSexTable AttributableFractionEngine::attributable_fraction(const QuantileTable &scenario,
                                                                    const QuantileTable &baseline) {
    if (!scenario.same_shape(baseline)) {
        throw core::InputFormatError("Scenario and baseline relative risk tables shape mismatch.");
    }

    auto scenario_sums = scenario.row_sums();
    auto baseline_sums = baseline.row_sums();
    return combine_strata(scenario_sums, baseline_sums,
                          [](double s, double b) { return 1.0 - s / b; });
}

DoubleAgeSexTable
AttributableFractionEngine::alternative_attributable_fraction(const QuantileTable &scenario,
                                                              const QuantileTable &baseline) {
    if (!scenario.same_shape(baseline)) {
        throw core::InputFormatError("Scenario and baseline relative risk tables shape mismatch.");
    }

    auto scenario_sums = scenario.row_sums();
    auto baseline_sums = baseline.row_sums();
    return combine_strata(scenario_sums, baseline_sums,
                          [](double s, double b) { return (s - b) / s; });
}

QuantileTable AttributableFractionEngine::ratio(const QuantileTable &numerator,
                                                const QuantileTable &denominator) {
    return combine_quantiles(numerator, denominator, [](double n, double d) { return n / d; });
}

QuantileTable AttributableFractionEngine::normalise_disease_burden(const QuantileTable &relative_risk) {
    return transform_quantiles(
        relative_risk, [&relative_risk](int age_class, core::Gender gender, std::size_t q,
                                        double value) {
            return q == 0 ? 1.0 : value / relative_risk.at(age_class, gender, 0);
        });
}
} // namespace ithim
