#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Data structures containing model parameters and configuration options
 *
 * POCO stands for "plain old class object". These structs represent data structures
 * which are contained in JSON-formatted configuration files.
 */
namespace ithim::input::poco {

//! Input data files, relative paths are rebased on the configuration folder
struct InputFilesInfo {
    std::filesystem::path active_transport;
    std::filesystem::path population_share;
    std::optional<std::filesystem::path> non_travel_weights;
    std::filesystem::path disease_burden;

    auto operator<=>(const InputFilesInfo &rhs) const = default;
};

//! Population exposure parameters of the baseline
struct ExposureInfo {
    std::string mean_type;
    double mean_walking_time{};
    double mean_cycling_time{};
    double mean_non_travel{};
    double travel_cv{};
    double non_travel_cv{};

    auto operator<=>(const ExposureInfo &rhs) const = default;
};

//! Scenario overrides of the baseline exposure parameters
struct ScenarioInfo {
    std::string name;
    std::optional<std::string> mean_type;
    std::optional<double> mean_walking_time;
    std::optional<double> mean_cycling_time;
    std::optional<double> mean_non_travel;
    std::optional<double> travel_cv;
    std::optional<double> non_travel_cv;
    std::optional<std::filesystem::path> active_transport;

    auto operator<=>(const ScenarioInfo &rhs) const = default;
};

//! Experiment run-time options
struct RunningInfo {
    std::optional<unsigned int> seed;
    std::size_t sample_size{100000};
    std::vector<double> quantiles{0.1, 0.3, 0.5, 0.7, 0.9};
    std::optional<double> walking_met;
    std::optional<double> cycling_met;
    std::optional<double> exponent;

    auto operator<=>(const RunningInfo &rhs) const = default;
};

//! Experiment output folder and file name
struct OutputInfo {
    std::string folder{};
    std::string file_name{};

    auto operator<=>(const OutputInfo &rhs) const = default;
};
} // namespace ithim::input::poco
