#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace ithim {

/// @brief The default exposure quantile probabilities
inline const std::vector<double> default_quantiles{0.1, 0.3, 0.5, 0.7, 0.9};

/// @brief Defines the model policy constants with their documented defaults
///
/// @details These values are literature or policy constants, not calibrated
/// parameters. They are kept apart from the model parameters so a comparison
/// can override them in one place.
struct ModelOptions {
    /// @brief Walking intensity, MET per hour of walking
    double walking_met{4.5};

    /// @brief Cycling intensity, MET per hour of cycling
    double cycling_met{6.0};

    /// @brief Dose-response power-law extrapolation exponent k
    double exponent{0.5};

    /// @brief Monte-Carlo sample size per stratum
    std::size_t sample_size{100000};

    /// @brief Lower bound applied to the total MET quantiles
    double met_floor{0.1};

    /// @brief Value replacing non-positive means before the log transform
    double mean_floor{0.01};

    /// @brief Random number generator seed, random device seeded when empty
    std::optional<unsigned int> seed{};
};
} // namespace ithim
