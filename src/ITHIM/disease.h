#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ithim {

/// @brief Enumerates the diseases affected by physical activity exposure
///
/// @details Injuries (RTIs) follow a separate health pathway and are not
/// part of this enumeration.
enum class DiseaseType : uint8_t {
    /// @brief Breast cancer, females only
    breast_cancer,

    /// @brief Colon cancer
    colon_cancer,

    /// @brief Cardiovascular disease
    cvd,

    /// @brief Dementia
    dementia,

    /// @brief Depression
    depression,

    /// @brief Type 2 diabetes
    diabetes
};

/// @brief The full list of physical activity diseases, in enumeration order
inline constexpr std::array<DiseaseType, 6> all_diseases{
    DiseaseType::breast_cancer, DiseaseType::colon_cancer, DiseaseType::cvd,
    DiseaseType::dementia,      DiseaseType::depression,   DiseaseType::diabetes};

/// @brief Enumerates the disease burden measures
enum class BurdenType : uint8_t {
    /// @brief Number of deaths
    deaths,

    /// @brief Years of life lost
    yll,

    /// @brief Years lived with disability
    yld,

    /// @brief Disability-adjusted life years
    daly
};

/// @brief The full list of burden measures, in enumeration order
inline constexpr std::array<BurdenType, 4> all_burden_types{BurdenType::deaths, BurdenType::yll,
                                                            BurdenType::yld, BurdenType::daly};

/// @brief The injury disease name, recognised in burden files but outside this pathway
inline constexpr std::string_view injury_disease_name = "RTIs";

/// @brief Converts a disease type to its canonical name, e.g. BreastCancer
/// @param disease The disease type
/// @return The disease name
std::string to_string(DiseaseType disease);

/// @brief Converts a burden type to its canonical name, e.g. daly
/// @param burden The burden type
/// @return The burden type name
std::string to_string(BurdenType burden);

/// @brief Converts a disease name to its DiseaseType equivalent, case-insensitive
/// @param name The disease name
/// @return The disease type
/// @throws core::ConfigurationError for unknown disease names, including the injury pathway
DiseaseType parse_disease_type(std::string_view name);

/// @brief Converts a burden type name to its BurdenType equivalent, case-insensitive
/// @param name The burden type name
/// @return The burden type
/// @throws core::ConfigurationError for unknown burden type names
BurdenType parse_burden_type(std::string_view name);

/// @brief Determines whether a disease name refers to the injury pathway
/// @param name The disease name
/// @return true for the injury pathway name; otherwise, false
bool is_injury_disease(std::string_view name) noexcept;
} // namespace ithim
