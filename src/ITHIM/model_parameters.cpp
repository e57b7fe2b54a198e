#include "model_parameters.h"

#include "monotonic_vector.h"
#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/string_util.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

void check_strata(const ithim::DoubleAgeSexTable &reference, const ithim::DoubleAgeSexTable &table,
                  std::string_view name) {
    if (table.empty()) {
        throw ithim::core::InputFormatError(fmt::format("Missing {} stratified values.", name));
    }

    if (!reference.same_strata(table)) {
        throw ithim::core::InputFormatError(
            fmt::format("The {} age classes do not match the walking weights age classes.", name));
    }
}

void check_non_negative(const ithim::DoubleAgeSexTable &table, std::string_view name) {
    for (const auto &age_class : table.age_classes()) {
        for (const auto &gender : ithim::stratum_genders) {
            if (table.at(age_class, gender) < 0.0) {
                throw ithim::core::NumericDomainError(
                    fmt::format("Negative {} value at age class {}.", name, age_class));
            }
        }
    }
}

void check_non_negative(double value, std::string_view name) {
    if (value < 0.0) {
        throw ithim::core::NumericDomainError(
            fmt::format("The {} must not be negative, given {}.", name, value));
    }
}
} // namespace

namespace ithim {

std::string to_string(MeanType type) {
    switch (type) {
    case MeanType::overall:
        return "overall";
    case MeanType::referent:
        return "referent";
    }

    throw core::ConfigurationError(
        fmt::format("Unknown mean type value: {}", static_cast<int>(type)));
}

MeanType parse_mean_type(std::string_view name) {
    if (core::case_insensitive::equals(name, "overall")) {
        return MeanType::overall;
    }

    if (core::case_insensitive::equals(name, "referent")) {
        return MeanType::referent;
    }

    throw core::ConfigurationError(
        fmt::format("Unknown mean type: '{}', must be overall or referent.", name));
}

std::string to_string(ActivityMode mode) {
    switch (mode) {
    case ActivityMode::walking:
        return "walking";
    case ActivityMode::cycling:
        return "cycling";
    }

    throw core::InputFormatError(
        fmt::format("Unknown activity mode value: {}", static_cast<int>(mode)));
}

ActivityMode parse_activity_mode(std::string_view name) {
    if (core::case_insensitive::equals(name, "walking")) {
        return ActivityMode::walking;
    }

    if (core::case_insensitive::equals(name, "cycling")) {
        return ActivityMode::cycling;
    }

    throw core::InputFormatError(
        fmt::format("Unknown active travel mode: '{}', must be walking or cycling.", name));
}

void ModelParameters::validate() const {
    if (walking_weights.empty()) {
        throw core::InputFormatError("Missing walking weights stratified values.");
    }

    check_strata(walking_weights, cycling_weights, "cycling weights");
    check_strata(walking_weights, non_travel_weights, "non-travel weights");
    check_strata(walking_weights, population_share, "population share");

    check_non_negative(walking_weights, "walking weight");
    check_non_negative(cycling_weights, "cycling weight");
    check_non_negative(non_travel_weights, "non-travel weight");
    check_non_negative(population_share, "population share");

    check_non_negative(mean_walking_time, "mean walking time");
    check_non_negative(mean_cycling_time, "mean cycling time");
    check_non_negative(mean_non_travel, "mean non-travel activity");
    check_non_negative(travel_cv, "travel coefficient of variation");
    check_non_negative(non_travel_cv, "non-travel coefficient of variation");

    for (const auto &probability : quantiles) {
        if (probability <= 0.0 || probability >= 1.0) {
            throw core::NumericDomainError(fmt::format(
                "Quantile probability {} is outside of the open interval (0, 1).", probability));
        }
    }

    if (quantiles.empty() || !is_strictly_increasing(quantiles)) {
        throw core::InputFormatError(fmt::format(
            "Quantile probabilities must be strictly increasing: {}.", fmt::join(quantiles, ", ")));
    }
}

const std::vector<int> &ModelParameters::age_classes() const noexcept {
    return walking_weights.age_classes();
}
} // namespace ithim
