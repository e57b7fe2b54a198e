/**
 * @file
 * @brief Functionality for parsing console application's command-line arguments
 */
#pragma once

#include <cxxopts.hpp>

#include <optional>
#include <string>

namespace ithim {
/// @brief Defines the Command Line Interface (CLI) arguments options
struct CommandOptions {
    /// @brief The configuration file full path
    std::string config_file;

    /// @brief The output folder where results will be saved
    std::optional<std::string> output_folder;

    /// @brief Indicates whether the application logging is verbose
    bool verbose{};

    /// @brief The maximum number of threads to use (0: no limit).
    size_t num_threads{};

    /// @brief The burden type to query: deaths, yll, yld or daly
    std::string burden{"daly"};

    /// @brief The disease to query, or `all` for the sum over diseases
    std::string disease{"all"};
};

/// @brief Creates the command-line interface (CLI) options
/// @return ITHIM CLI options
cxxopts::Options create_options();

/// @brief Parses the command-line interface (CLI) arguments
/// @param options The valid CLI options
/// @param argc Number of input arguments
/// @param argv List of input arguments
/// @return User command-line options or std::nullopt if program should exit
std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv);

} // namespace ithim
