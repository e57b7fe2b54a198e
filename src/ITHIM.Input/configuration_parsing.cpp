#include "configuration_parsing.h"
#include "configuration_parsing_helpers.h"
#include "jsonparser.h"

#include "ITHIM.Core/exception.h"
#include "ITHIM/model_parameters.h"

#include <fmt/color.h>

namespace ithim::input {
using json = nlohmann::json;

//! The supported configuration file version
constexpr int ConfigVersion = 1;

nlohmann::json get(const json &j, const std::string &key) {
    try {
        return j.at(key);
    } catch (const std::exception &) {
        fmt::print(fmt::fg(fmt::color::red), "Missing key \"{}\"\n", key);
        throw core::ConfigurationError{fmt::format("Missing key \"{}\"", key)};
    }
}

void rebase_valid_path(std::filesystem::path &path, const std::filesystem::path &base_dir) try {
    if (path.is_relative()) {
        path = std::filesystem::absolute(base_dir / path);
    }

    if (!std::filesystem::exists(path)) {
        throw core::ConfigurationError{fmt::format("Path does not exist: {}", path.string())};
    }
} catch (const std::filesystem::filesystem_error &) {
    throw core::ConfigurationError{fmt::format("OS error while reading path {}", path.string())};
}

// NOLINTNEXTLINE(bugprone-exception-escape)
bool rebase_valid_path_to(const json &j, const std::string &key, std::filesystem::path &out,
                          const std::filesystem::path &base_dir) noexcept {
    std::string file_name;
    if (!get_to(j, key, file_name)) {
        return false;
    }

    out = file_name;
    try {
        rebase_valid_path(out, base_dir);
    } catch (const core::ConfigurationError &) {
        fmt::print(fmt::fg(fmt::color::red), "Could not find file {}\n", out.string());
        return false;
    }

    return true;
}

// NOLINTNEXTLINE(bugprone-exception-escape)
void rebase_valid_path_to(const json &j, const std::string &key, std::filesystem::path &out,
                          const std::filesystem::path &base_dir, bool &success) noexcept {
    if (!rebase_valid_path_to(j, key, out, base_dir)) {
        success = false;
    }
}

void check_version(const json &j) {
    int version;
    if (!get_to(j, "version", version)) {
        throw core::ConfigurationError{"File must have a schema version"};
    }

    if (version != ConfigVersion) {
        throw core::ConfigurationError{fmt::format(
            "Configuration schema version: {} mismatch, supported: {}", version, ConfigVersion)};
    }
}

void load_input_info(const json &j, Configuration &config) {
    const auto inputs = get(j, "inputs");

    bool success = true;
    rebase_valid_path_to(inputs, "active_transport", config.inputs.active_transport,
                         config.root_path, success);
    rebase_valid_path_to(inputs, "population_share", config.inputs.population_share,
                         config.root_path, success);
    rebase_valid_path_to(inputs, "disease_burden", config.inputs.disease_burden, config.root_path,
                         success);

    // Non-travel weights are optional, uniform when missing
    if (inputs.contains("non_travel_weights") && !inputs["non_travel_weights"].is_null()) {
        std::filesystem::path file_name;
        rebase_valid_path_to(inputs, "non_travel_weights", file_name, config.root_path, success);
        config.inputs.non_travel_weights = file_name;
    }

    if (!success) {
        throw core::ConfigurationError{"Could not load input files info"};
    }

    if (config.verbosity == core::VerboseMode::verbose) {
        fmt::print("{:<20}: {}\n", "Active transport", config.inputs.active_transport.string());
        fmt::print("{:<20}: {}\n", "Population share", config.inputs.population_share.string());
        fmt::print("{:<20}: {}\n", "Disease burden", config.inputs.disease_burden.string());
    }
}

void load_baseline_info(const json &j, Configuration &config) {
    if (!get_to(j, "baseline", config.baseline)) {
        throw core::ConfigurationError{"Could not load baseline info"};
    }

    try {
        static_cast<void>(parse_mean_type(config.baseline.mean_type));
    } catch (const core::ConfigurationError &) {
        fmt::print(fmt::fg(fmt::color::red), "Invalid baseline mean type: {}\n",
                   config.baseline.mean_type);
        throw;
    }
}

void load_scenario_info(const json &j, Configuration &config) {
    if (!get_to(j, "scenario", config.scenario)) {
        throw core::ConfigurationError{"Could not load scenario info"};
    }

    if (config.scenario.mean_type.has_value()) {
        static_cast<void>(parse_mean_type(config.scenario.mean_type.value()));
    }

    if (config.scenario.active_transport.has_value()) {
        rebase_valid_path(config.scenario.active_transport.value(), config.root_path);
    }
}

void load_running_info(const json &j, Configuration &config) {
    if (!get_to(j, "running", config.running)) {
        throw core::ConfigurationError{"Could not load running info"};
    }

    if (config.running.sample_size < 1) {
        throw core::ConfigurationError{"The running sample size must be greater than zero"};
    }

    if (config.running.quantiles.empty()) {
        throw core::ConfigurationError{"The running quantiles list must not be empty"};
    }
}

void load_output_info(const json &j, Configuration &config,
                      const std::optional<std::string> &output_folder) {
    if (!get_to(j, "output", config.output)) {
        throw core::ConfigurationError{"Could not load output info"};
    }

    if (output_folder.has_value()) {
        config.output.folder = output_folder.value();
    } else {
        config.output.folder = expand_environment_variables(config.output.folder);
    }

    if (config.output.folder.empty()) {
        throw core::ConfigurationError{"Must specify an output folder"};
    }
}
} // namespace ithim::input
