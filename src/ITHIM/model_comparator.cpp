#include "model_comparator.h"

#include "burden_aggregator.h"
#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/string_util.h"

#include <fmt/format.h>

#include <utility>

namespace ithim {

ComparisonReport::ComparisonReport(std::map<DiseaseType, DiseaseComparison> results)
    : results_{std::move(results)} {}

std::vector<DiseaseType> ComparisonReport::diseases() const {
    auto result = std::vector<DiseaseType>{};
    result.reserve(results_.size());
    for (const auto &entry : results_) {
        result.emplace_back(entry.first);
    }

    return result;
}

bool ComparisonReport::contains(DiseaseType disease) const noexcept {
    return results_.contains(disease);
}

const DiseaseComparison &ComparisonReport::at(DiseaseType disease) const {
    auto it = results_.find(disease);
    if (it == results_.end()) {
        throw core::MissingBurdenDataError(fmt::format(
            "Disease {} is not contained in the disease burden table.", to_string(disease)));
    }

    return it->second;
}

double ComparisonReport::delta_burden(BurdenType burden, std::optional<DiseaseType> disease) const {
    if (disease.has_value()) {
        return at(disease.value()).delta.at(burden).sum();
    }

    auto total = 0.0;
    for (const auto &entry : results_) {
        total += entry.second.delta.at(burden).sum();
    }

    return total;
}

ModelComparator::ModelComparator(DoseResponseModel dose_response)
    : dose_response_{std::move(dose_response)} {}

ComparisonReport ModelComparator::compare(const Model &baseline, const Model &scenario) const {
    const auto &baseline_met = baseline.quantiles().total_met;
    const auto &scenario_met = scenario.quantiles().total_met;
    if (!baseline_met.same_shape(scenario_met)) {
        throw core::InputFormatError(
            "Baseline and scenario models must have the same strata and quantiles.");
    }

    const auto &burden = baseline.parameters().burden;
    burden.validate(baseline_met.age_classes());

    auto dose_response =
        dose_response_.has_value()
            ? dose_response_.value()
            : DoseResponseModel::create_default(MonotonicVector<int>(baseline_met.age_classes()),
                                                baseline.options().exponent);

    auto diseases = burden.diseases();
    auto baseline_rr = dose_response.evaluate(baseline_met, diseases);
    auto scenario_rr = dose_response.evaluate(scenario_met, diseases);

    auto engine = AttributableFractionEngine{};
    auto aggregator = BurdenAggregator{burden};
    auto results = std::map<DiseaseType, DiseaseComparison>{};
    for (const auto &disease : diseases) {
        auto risk = engine.compute(baseline_rr.at(disease), scenario_rr.at(disease));
        auto delta = aggregator.delta(disease, risk);
        results.emplace(disease, DiseaseComparison{.risk = std::move(risk), .delta = std::move(delta)});
    }

    return ComparisonReport{std::move(results)};
}

double delta_burden(const Model &baseline, const Model &scenario, BurdenType burden,
                    std::optional<DiseaseType> disease) {
    if (disease.has_value() && !baseline.parameters().burden.contains(disease.value())) {
        throw core::MissingBurdenDataError(fmt::format(
            "Disease {} is not contained in the disease burden table.", to_string(disease.value())));
    }

    auto report = ModelComparator{}.compare(baseline, scenario);
    return report.delta_burden(burden, disease);
}

double delta_burden(const Model &baseline, const Model &scenario, std::string_view burden,
                    std::string_view disease) {
    return delta_burden(baseline, scenario, parse_burden_type(burden),
                        parse_disease_filter(disease));
}

double get_burden(const Model &model, BurdenType burden, std::optional<DiseaseType> disease) {
    return model.parameters().burden.total(burden, disease);
}

double get_burden(const Model &model, std::string_view burden, std::string_view disease) {
    return get_burden(model, parse_burden_type(burden), parse_disease_filter(disease));
}

std::optional<DiseaseType> parse_disease_filter(std::string_view name) {
    if (core::case_insensitive::equals(name, "all")) {
        return std::nullopt;
    }

    return parse_disease_type(name);
}
} // namespace ithim
