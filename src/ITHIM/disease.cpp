#include "disease.h"

#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/string_util.h"

#include <fmt/format.h>

namespace ithim {

std::string to_string(DiseaseType disease) {
    switch (disease) {
    case DiseaseType::breast_cancer:
        return "BreastCancer";
    case DiseaseType::colon_cancer:
        return "ColonCancer";
    case DiseaseType::cvd:
        return "CVD";
    case DiseaseType::dementia:
        return "Dementia";
    case DiseaseType::depression:
        return "Depression";
    case DiseaseType::diabetes:
        return "Diabetes";
    }

    throw core::ConfigurationError(
        fmt::format("Unknown disease type value: {}", static_cast<int>(disease)));
}

std::string to_string(BurdenType burden) {
    switch (burden) {
    case BurdenType::deaths:
        return "deaths";
    case BurdenType::yll:
        return "yll";
    case BurdenType::yld:
        return "yld";
    case BurdenType::daly:
        return "daly";
    }

    throw core::ConfigurationError(
        fmt::format("Unknown burden type value: {}", static_cast<int>(burden)));
}

DiseaseType parse_disease_type(std::string_view name) {
    for (const auto &disease : all_diseases) {
        if (core::case_insensitive::equals(name, to_string(disease))) {
            return disease;
        }
    }

    if (is_injury_disease(name)) {
        throw core::ConfigurationError(
            fmt::format("Disease '{}' is outside of the physical activity pathway.", name));
    }

    throw core::ConfigurationError(fmt::format("Unknown disease name: '{}'.", name));
}

BurdenType parse_burden_type(std::string_view name) {
    for (const auto &burden : all_burden_types) {
        if (core::case_insensitive::equals(name, to_string(burden))) {
            return burden;
        }
    }

    throw core::ConfigurationError(fmt::format(
        "Unknown burden type: '{}', must be one of: deaths, yll, yld or daly.", name));
}

bool is_injury_disease(std::string_view name) noexcept {
    return core::case_insensitive::equals(name, injury_disease_name);
}
} // namespace ithim
