#pragma once

#include "age_sex_table.h"
#include "disease_burden.h"
#include "model_options.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ithim {

/// @brief Enumerates the stratum means normalisation modes
enum class MeanType : uint8_t {
    /// @brief Population mean scaled by the population-weighted average weight
    overall,

    /// @brief Population mean is the referent stratum mean, weights are multipliers
    referent
};

/// @brief Enumerates the active travel modes
enum class ActivityMode : uint8_t {
    /// @brief Walking as transport
    walking,

    /// @brief Cycling as transport
    cycling
};

/// @brief Converts a mean type to its name
/// @param type The mean type
/// @return The mean type name
std::string to_string(MeanType type);

/// @brief Converts a mean type name to its MeanType equivalent, case-insensitive
/// @param name The mean type name
/// @return The mean type
/// @throws core::ConfigurationError for unknown mean type names
MeanType parse_mean_type(std::string_view name);

/// @brief Converts an activity mode to its name
/// @param mode The activity mode
/// @return The activity mode name
std::string to_string(ActivityMode mode);

/// @brief Converts an activity mode name to its ActivityMode equivalent, case-insensitive
/// @param name The activity mode name
/// @return The activity mode
/// @throws core::InputFormatError for unknown activity mode names
ActivityMode parse_activity_mode(std::string_view name);

/// @brief Defines the exposure and burden parameters of a population
///
/// @details Weights are relative stratum shape factors, the population means
/// set the scale. All stratified tables must share the same age classes.
struct ModelParameters {
    /// @brief Relative walking time weights per stratum
    DoubleAgeSexTable walking_weights{};

    /// @brief Relative cycling time weights per stratum
    DoubleAgeSexTable cycling_weights{};

    /// @brief Relative non-travel activity weights per stratum
    DoubleAgeSexTable non_travel_weights{};

    /// @brief Population share of each stratum
    DoubleAgeSexTable population_share{};

    /// @brief Population mean walking time, minutes per week
    double mean_walking_time{};

    /// @brief Population mean cycling time, minutes per week
    double mean_cycling_time{};

    /// @brief Population mean non-travel activity, MET-hours per week
    double mean_non_travel{};

    /// @brief Coefficient of variation of active transport time
    double travel_cv{};

    /// @brief Coefficient of variation of non-travel activity
    double non_travel_cv{};

    /// @brief Stratum means normalisation mode
    MeanType mean_type{MeanType::overall};

    /// @brief Exposure quantile probabilities
    std::vector<double> quantiles{default_quantiles};

    /// @brief Baseline disease burden by disease, burden type and stratum
    DiseaseBurdenTable burden{};

    /// @brief Validates the parameters consistency
    /// @throws core::InputFormatError for stratified tables shape mismatch or unordered quantiles
    /// @throws core::NumericDomainError for negative values or quantiles outside (0,1)
    void validate() const;

    /// @brief Gets the parameters age classes
    /// @return The age classes in increasing order
    const std::vector<int> &age_classes() const noexcept;
};
} // namespace ithim
