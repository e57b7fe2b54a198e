#include "configuration.h"
#include "configuration_parsing.h"
#include "csvparser.h"
#include "jsonparser.h"

#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/scoped_timer.h"
#include "ITHIM.Core/string_util.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <fstream>

#if ITHIM_USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    ithim::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {

nlohmann::json load_json(const std::filesystem::path &file_path) {
    auto ifs = std::ifstream{file_path};
    if (!ifs) {
        throw ithim::core::ConfigurationError(
            fmt::format("File not found: {}", file_path.string()));
    }

    try {
        return nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error &ex) {
        throw ithim::core::ConfigurationError(
            fmt::format("Malformed JSON file: {}, {}", file_path.string(), ex.what()));
    }
}

ithim::DoubleAgeSexTable uniform_weights(const std::vector<int> &age_classes) {
    return ithim::DoubleAgeSexTable(ithim::MonotonicVector<int>(age_classes), 1.0);
}
} // anonymous namespace

namespace ithim::input {
using json = nlohmann::json;

Configuration get_configuration(const std::filesystem::path &config_file,
                                const std::optional<std::string> &output_folder, bool verbose) {
    MEASURE_FUNCTION();
    bool success = true;

    Configuration config;

    // verbosity
    config.verbosity = core::VerboseMode::none;
    if (verbose) {
        config.verbosity = core::VerboseMode::verbose;
    }

    const auto opt = load_json(config_file);
    check_version(opt);

    // Base dir for relative paths
    config.root_path = config_file.parent_path();

    // input data files
    try {
        load_input_info(opt, config);
    } catch (const core::ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load input files: {}\n", e.message());
    }

    // Baseline exposure
    try {
        load_baseline_info(opt, config);
    } catch (const core::ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load baseline info: {}\n", e.message());
    }

    // Scenario overrides
    try {
        load_scenario_info(opt, config);
    } catch (const core::ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load scenario info: {}\n", e.message());
    }

    // Run-time info
    try {
        load_running_info(opt, config);
    } catch (const core::ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load running info: {}\n", e.message());
    }

    try {
        load_output_info(opt, config, output_folder);
    } catch (const core::ConfigurationError &e) {
        success = false;
        fmt::print(fg(fmt::color::red), "Could not load output info: {}\n", e.message());
    }

    if (!success) {
        throw core::ConfigurationError{"Error loading config file"};
    }

    return config;
}

ModelOptions create_model_options(const Configuration &config) {
    auto options = ModelOptions{};
    options.sample_size = config.running.sample_size;
    options.seed = config.running.seed;
    if (config.running.walking_met.has_value()) {
        options.walking_met = config.running.walking_met.value();
    }

    if (config.running.cycling_met.has_value()) {
        options.cycling_met = config.running.cycling_met.value();
    }

    if (config.running.exponent.has_value()) {
        options.exponent = config.running.exponent.value();
    }

    return options;
}

ModelParameters create_baseline_parameters(const Configuration &config) {
    MEASURE_FUNCTION();
    auto active_transport = load_active_transport_time(config.inputs.active_transport);
    auto age_classes = active_transport.walking.age_classes();

    auto parameters = ModelParameters{};
    parameters.walking_weights = std::move(active_transport.walking);
    parameters.cycling_weights = std::move(active_transport.cycling);
    parameters.population_share = load_age_sex_table(config.inputs.population_share);
    if (config.inputs.non_travel_weights.has_value()) {
        parameters.non_travel_weights = load_age_sex_table(config.inputs.non_travel_weights.value());
    } else {
        parameters.non_travel_weights = uniform_weights(age_classes);
    }

    parameters.mean_walking_time = config.baseline.mean_walking_time;
    parameters.mean_cycling_time = config.baseline.mean_cycling_time;
    parameters.mean_non_travel = config.baseline.mean_non_travel;
    parameters.travel_cv = config.baseline.travel_cv;
    parameters.non_travel_cv = config.baseline.non_travel_cv;
    parameters.mean_type = parse_mean_type(config.baseline.mean_type);
    parameters.quantiles = config.running.quantiles;
    parameters.burden = load_disease_burden(config.inputs.disease_burden);

    if (config.verbosity == core::VerboseMode::verbose) {
        fmt::print("Age classes: {}, diseases: {}, quantiles: {}\n", age_classes.size(),
                   parameters.burden.diseases().size(), parameters.quantiles.size());
    }

    return parameters;
}

ModelParameters create_scenario_parameters(const Configuration &config,
                                           const ModelParameters &baseline) {
    const auto &info = config.scenario;
    auto parameters = baseline;
    if (info.active_transport.has_value()) {
        auto active_transport = load_active_transport_time(info.active_transport.value());
        parameters.walking_weights = std::move(active_transport.walking);
        parameters.cycling_weights = std::move(active_transport.cycling);
    }

    if (info.mean_type.has_value()) {
        parameters.mean_type = parse_mean_type(info.mean_type.value());
    }

    parameters.mean_walking_time = info.mean_walking_time.value_or(baseline.mean_walking_time);
    parameters.mean_cycling_time = info.mean_cycling_time.value_or(baseline.mean_cycling_time);
    parameters.mean_non_travel = info.mean_non_travel.value_or(baseline.mean_non_travel);
    parameters.travel_cv = info.travel_cv.value_or(baseline.travel_cv);
    parameters.non_travel_cv = info.non_travel_cv.value_or(baseline.non_travel_cv);
    return parameters;
}

std::string create_output_file_name(const poco::OutputInfo &info) {
    namespace fs = std::filesystem;

    fs::path output_folder = expand_environment_variables(info.folder);
    auto tp = std::chrono::system_clock::now();
    auto timestamp_tk = fmt::format("{0:%F_%H-%M-}{1:%S}", tp, tp.time_since_epoch());

    // filename token replacement
    auto file_name = info.file_name;
    std::size_t tk_end = 0;
    auto tk_start = file_name.find_first_of('{', tk_end);
    if (tk_start != std::string::npos) {
        tk_end = file_name.find_first_of('}', tk_start + 1);
        if (tk_end != std::string::npos) {
            auto token_str = file_name.substr(tk_start, tk_end - tk_start + 1);
            if (!core::case_insensitive::equals(token_str, "{TIMESTAMP}")) {
                throw core::ConfigurationError(
                    fmt::format("Unknown output file token: {}", token_str));
            }

            file_name.replace(tk_start, tk_end - tk_start + 1, timestamp_tk);
        }
    }

    if (file_name.empty()) {
        file_name = fmt::format("ITHIM_result_{}.json", timestamp_tk);
    }

    auto result_file_name = (output_folder / file_name).string();
    fmt::print(fg(fmt::color::yellow_green), "Output file: {}.\n", result_file_name);
    return result_file_name;
}

std::string expand_environment_variables(const std::string &path) {
    if (path.find("${") == std::string::npos) {
        return path;
    }

    std::string pre = path.substr(0, path.find("${"));
    std::string post = path.substr(path.find("${") + 2);
    if (post.find('}') == std::string::npos) {
        return path;
    }

    std::string variable = post.substr(0, post.find('}'));
    std::string value;

    post = post.substr(post.find('}') + 1);
    if (const char *v = std::getenv(variable.c_str())) {
        value = v;
    }

    return expand_environment_variables(pre + value + post);
}
} // namespace ithim::input
