/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the main functions required to load JSON-formatted
 * configuration files from disk and to create the model inputs from them.
 */
#pragma once

#include "poco.h"
#include "version.h"

#include "ITHIM.Core/forward_type.h"
#include "ITHIM/model_options.h"
#include "ITHIM/model_parameters.h"

#include <filesystem>
#include <optional>
#include <string>

namespace ithim::input {

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The root path for configuration files
    std::filesystem::path root_path;

    /// @brief The input data files
    poco::InputFilesInfo inputs;

    /// @brief Baseline population exposure parameters
    poco::ExposureInfo baseline;

    /// @brief Scenario overrides of the baseline parameters
    poco::ScenarioInfo scenario;

    /// @brief Experiment run-time options
    poco::RunningInfo running;

    /// @brief Experiment output folder and file information
    poco::OutputInfo output;

    /// @brief Application logging verbosity mode
    ithim::core::VerboseMode verbosity{};

    /// @brief Experiment model name
    const char *app_name = PROJECT_NAME;

    /// @brief Experiment model version
    const char *app_version = PROJECT_VERSION;
};

/// @brief Loads the input configuration file, *.json, information
/// @param config_file Path to config file
/// @param output_folder Output folder, overrides the config file folder if provided
/// @param verbose Set log verbosity
/// @return The configuration file information
/// @throws core::ConfigurationError for invalid configuration file contents
Configuration get_configuration(const std::filesystem::path &config_file,
                                const std::optional<std::string> &output_folder, bool verbose);

/// @brief Creates the model options from the configuration run-time options
/// @param config User input configuration instance
/// @return The model options
ModelOptions create_model_options(const Configuration &config);

/// @brief Creates the baseline model parameters, loading the configuration input files
/// @param config User input configuration instance
/// @return The baseline parameters
/// @throws core::InputFormatError for malformed input files
/// @throws core::ConfigurationError for invalid mean type
ModelParameters create_baseline_parameters(const Configuration &config);

/// @brief Creates the scenario model parameters applying the scenario overrides to the baseline
/// @param config User input configuration instance
/// @param baseline The baseline parameters
/// @return The scenario parameters
/// @throws core::InputFormatError for malformed scenario input files
/// @throws core::ConfigurationError for invalid mean type
ModelParameters create_scenario_parameters(const Configuration &config,
                                           const ModelParameters &baseline);

/// @brief Creates the full output file name from user input configuration
/// @param info User output information, may contain relative path and environment variables
/// @return Output file full name
std::string create_output_file_name(const poco::OutputInfo &info);

/// @brief Expand environment variables in path to respective values
/// @param path The source path to information
/// @return The resulting full path
std::string expand_environment_variables(const std::string &path);
} // namespace ithim::input
