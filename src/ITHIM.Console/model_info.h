#pragma once

#include <fmt/format.h>
#include <string>

namespace ithim {
/// @brief Comparative risk assessment run-time information for reproducibility.
struct ExperimentInfo {
    /// @brief The model name
    std::string model;

    /// @brief The model version
    std::string version;

    /// @brief Scenario name
    std::string scenario;

    /// @brief Number of MET exposure samples per stratum
    std::size_t sample_size{};

    /// @brief Initialisation seed value
    unsigned int seed{};

    /// @brief Creates a string representation of this instance
    /// @return The string representation
    std::string to_string() const noexcept {
        return fmt::format("{} v{} - {} samples: {} seed: {}", model, version, scenario,
                           sample_size, seed);
    }
};
} // namespace ithim
