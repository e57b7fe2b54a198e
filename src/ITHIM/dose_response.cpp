#include "dose_response.h"

#include "ITHIM.Core/exception.h"

#include <cmath>
#include <fmt/format.h>

namespace ithim {

DoseResponseCurve::DoseResponseCurve(DiseaseType disease, const DoubleAgeSexTable &exposure,
                                     const DoubleAgeSexTable &relative_risk, double exponent)
    : disease_{disease}, exponent_{exponent} {
    if (exposure.empty() || !exposure.same_strata(relative_risk)) {
        throw core::InputFormatError(fmt::format(
            "{} literature exposure and relative risk age classes mismatch.", to_string(disease)));
    }

    per_unit_rr_ = combine_strata(exposure, relative_risk, [this](double level, double risk) {
        if (level <= 0.0 || risk <= 0.0) {
            throw core::NumericDomainError(
                fmt::format("{} literature anchor must be positive, given exposure {} and RR {}.",
                            to_string(disease_), level, risk));
        }

        return std::pow(risk, std::pow(1.0 / level, exponent_));
    });
}

DiseaseType DoseResponseCurve::disease() const noexcept { return disease_; }

double DoseResponseCurve::exponent() const noexcept { return exponent_; }

const DoubleAgeSexTable &DoseResponseCurve::per_unit_relative_risk() const noexcept {
    return per_unit_rr_;
}

double DoseResponseCurve::relative_risk_at(int age_class, core::Gender gender,
                                           double exposure) const {
    return std::pow(per_unit_rr_.at(age_class, gender), std::pow(exposure, exponent_));
}

QuantileTable DoseResponseCurve::evaluate(const QuantileTable &exposure) const {
    if (exposure.age_classes() != per_unit_rr_.age_classes()) {
        throw core::InputFormatError(fmt::format(
            "{} dose-response and exposure age classes mismatch.", to_string(disease_)));
    }

    return transform_quantiles(
        exposure, [this](int age_class, core::Gender gender, std::size_t, double value) {
            return relative_risk_at(age_class, gender, value);
        });
}

DoseResponseModel::DoseResponseModel(std::vector<DoseResponseCurve> curves) {
    for (auto &curve : curves) {
        auto disease = curve.disease();
        curves_.insert_or_assign(disease, std::move(curve));
    }
}

DoseResponseModel DoseResponseModel::create_default(const MonotonicVector<int> &age_classes,
                                                    double exponent) {
    auto curves = std::vector<DoseResponseCurve>{};
    curves.reserve(all_diseases.size());
    for (const auto &disease : all_diseases) {
        auto exposure = DoubleAgeSexTable(age_classes);
        auto relative_risk = DoubleAgeSexTable(age_classes);
        for (std::size_t index = 0; index < age_classes.size(); index++) {
            for (const auto &gender : stratum_genders) {
                auto anchor = literature_anchor(disease, gender, index);
                exposure.at(age_classes[index], gender) = anchor.exposure;
                relative_risk.at(age_classes[index], gender) = anchor.relative_risk;
            }
        }

        curves.emplace_back(disease, exposure, relative_risk, exponent);
    }

    return DoseResponseModel{std::move(curves)};
}

ExposureAnchor DoseResponseModel::literature_anchor(DiseaseType disease, core::Gender gender,
                                                    std::size_t age_index) {
    switch (disease) {
    case DiseaseType::breast_cancer:
        if (gender == core::Gender::female) {
            return ExposureAnchor{.exposure = 4.5, .relative_risk = 0.944};
        }

        return ExposureAnchor{.exposure = 1.0, .relative_risk = 1.0};
    case DiseaseType::colon_cancer:
        if (gender == core::Gender::female) {
            return ExposureAnchor{.exposure = 30.1, .relative_risk = 0.86};
        }

        return ExposureAnchor{.exposure = 30.9, .relative_risk = 0.8};
    case DiseaseType::cvd:
        return ExposureAnchor{.exposure = 7.5, .relative_risk = 0.84};
    case DiseaseType::dementia:
        return ExposureAnchor{.exposure = 31.5, .relative_risk = 0.72};
    case DiseaseType::depression:
        // The three youngest age classes have a weaker association
        if (age_index < 3) {
            return ExposureAnchor{.exposure = 11.25, .relative_risk = 0.927945490148335};
        }

        return ExposureAnchor{.exposure = 11.25, .relative_risk = 0.859615572255727};
    case DiseaseType::diabetes:
        return ExposureAnchor{.exposure = 10.0, .relative_risk = 0.83};
    }

    throw core::ConfigurationError(
        fmt::format("Unknown disease type value: {}", static_cast<int>(disease)));
}

bool DoseResponseModel::contains(DiseaseType disease) const noexcept {
    return curves_.contains(disease);
}

const DoseResponseCurve &DoseResponseModel::at(DiseaseType disease) const {
    auto it = curves_.find(disease);
    if (it == curves_.end()) {
        throw core::ConfigurationError(
            fmt::format("Disease {} has no dose-response curve.", to_string(disease)));
    }

    return it->second;
}

std::map<DiseaseType, QuantileTable>
DoseResponseModel::evaluate(const QuantileTable &exposure,
                            const std::vector<DiseaseType> &diseases) const {
    auto result = std::map<DiseaseType, QuantileTable>{};
    for (const auto &disease : diseases) {
        result.emplace(disease, at(disease).evaluate(exposure));
    }

    return result;
}
} // namespace ithim
