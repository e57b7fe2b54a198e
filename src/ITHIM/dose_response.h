#pragma once

#include "age_sex_table.h"
#include "disease.h"
#include "monotonic_vector.h"
#include "quantile_table.h"

#include <map>
#include <vector>

namespace ithim {

/// @brief Defines a literature relative risk at a given exposure level
struct ExposureAnchor {
    /// @brief The literature exposure level, MET-hours per week
    double exposure{};

    /// @brief The literature relative risk at the exposure level
    double relative_risk{};
};

/// @brief Defines a disease power-law dose-response curve
///
/// @details Literature anchors are transformed into per-unit relative risks,
/// <c>RR1 = RR_lit^((1/E_lit)^k)</c>, and the curve is evaluated at an
/// exposure x as <c>RR(x) = RR1^(x^k)</c>.
class DoseResponseCurve {
  public:
    DoseResponseCurve() = delete;

    /// @brief Initialises a new instance of the DoseResponseCurve class
    /// @param disease The disease type
    /// @param exposure The stratified literature exposure levels
    /// @param relative_risk The stratified literature relative risks
    /// @param exponent The extrapolation exponent k
    /// @throws core::InputFormatError for exposure and relative risk strata mismatch
    /// @throws core::NumericDomainError for non-positive exposure levels or relative risks
    DoseResponseCurve(DiseaseType disease, const DoubleAgeSexTable &exposure,
                      const DoubleAgeSexTable &relative_risk, double exponent);

    /// @brief Gets the curve disease type
    /// @return The disease type
    DiseaseType disease() const noexcept;

    /// @brief Gets the extrapolation exponent k
    /// @return The exponent value
    double exponent() const noexcept;

    /// @brief Gets the per-unit exposure relative risks
    /// @return The stratified per-unit relative risks
    const DoubleAgeSexTable &per_unit_relative_risk() const noexcept;

    /// @brief Evaluates the curve at an exposure for one stratum
    /// @param age_class The stratum age class
    /// @param gender The stratum gender
    /// @param exposure The exposure level, MET-hours per week
    /// @return The relative risk compared with no exposure
    /// @throws std::out_of_range for unknown stratum
    double relative_risk_at(int age_class, core::Gender gender, double exposure) const;

    /// @brief Evaluates the curve at every stratum and exposure quantile
    /// @param exposure The exposure quantiles
    /// @return The relative risk quantiles
    /// @throws core::InputFormatError for exposure age classes mismatch
    QuantileTable evaluate(const QuantileTable &exposure) const;

  private:
    DiseaseType disease_;
    double exponent_;
    DoubleAgeSexTable per_unit_rr_;
};

/// @brief Defines the dose-response curves of the physical activity diseases
class DoseResponseModel {
  public:
    DoseResponseModel() = delete;

    /// @brief Initialises a new instance of the DoseResponseModel class
    /// @param curves The diseases dose-response curves
    explicit DoseResponseModel(std::vector<DoseResponseCurve> curves);

    /// @brief Creates the model with the literature anchors of all diseases
    /// @param age_classes The strata age classes
    /// @param exponent The extrapolation exponent k
    /// @return The dose-response model
    static DoseResponseModel create_default(const MonotonicVector<int> &age_classes,
                                            double exponent = 0.5);

    /// @brief Gets the literature anchor of a disease stratum
    /// @param disease The disease type
    /// @param gender The stratum gender
    /// @param age_index The zero-based stratum age class position
    /// @return The literature exposure level and relative risk
    static ExposureAnchor literature_anchor(DiseaseType disease, core::Gender gender,
                                            std::size_t age_index);

    /// @brief Determines whether the model has a disease curve
    /// @param disease The disease type
    /// @return true, if the disease curve exists; otherwise, false
    bool contains(DiseaseType disease) const noexcept;

    /// @brief Gets a disease dose-response curve
    /// @param disease The disease type
    /// @return The disease curve
    /// @throws core::ConfigurationError for diseases without curve
    const DoseResponseCurve &at(DiseaseType disease) const;

    /// @brief Evaluates the curves of a list of diseases
    /// @param exposure The exposure quantiles
    /// @param diseases The diseases to evaluate
    /// @return The relative risk quantiles by disease
    std::map<DiseaseType, QuantileTable> evaluate(const QuantileTable &exposure,
                                                  const std::vector<DiseaseType> &diseases) const;

  private:
    std::map<DiseaseType, DoseResponseCurve> curves_;
};
} // namespace ithim
