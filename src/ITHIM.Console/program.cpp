#include "ITHIM.Input/api.h"
#include "ITHIM/api.h"
#include "command_options.h"
#include "model_info.h"
#include "result_file_writer.h"

#include <fmt/chrono.h>
#include <fmt/color.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/task_arena.h>

namespace {
/// @brief Get a string representation of current system time
/// @return The system time as string
std::string get_time_now_str() {
    auto tp = std::chrono::system_clock::now();
    return fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch());
}

/// @brief Prints application start-up messages
void print_app_title() {
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold,
               "\n# ITHIM Physical Activity Comparative Risk Assessment #\n\n");

    fmt::print("Today: {}\nMaximum threads: {}\n\n", get_time_now_str(),
               tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism));
}

/// @brief Prints the burden changes of each disease and the queried total
void print_comparison(const ithim::ComparisonReport &report, const ithim::CommandOptions &cmd) {
    fmt::print(fg(fmt::color::cyan), "\n{:<12}", "Disease");
    for (const auto &burden : ithim::all_burden_types) {
        fmt::print(fg(fmt::color::cyan), "{:>14}", ithim::to_string(burden));
    }

    fmt::print("\n");
    for (const auto &disease : report.diseases()) {
        fmt::print("{:<12}", ithim::to_string(disease));
        for (const auto &burden : ithim::all_burden_types) {
            fmt::print("{:>14.4f}", report.delta_burden(burden, disease));
        }

        fmt::print("\n");
    }

    auto burden = ithim::parse_burden_type(cmd.burden);
    auto disease = ithim::parse_disease_filter(cmd.disease);
    if (disease.has_value() && !report.contains(disease.value())) {
        throw ithim::core::MissingBurdenDataError(
            fmt::format("Disease {} has no burden data.", cmd.disease));
    }

    fmt::print(fg(fmt::color::light_green), "\nChange in {} for {} diseases: {:.4f}\n",
               ithim::to_string(burden), cmd.disease, report.delta_burden(burden, disease));
}

/// @brief Prints application exit message
/// @param exit_code The application exit code
/// @return The respective exit code
int exit_application(int exit_code) {
    fmt::print("\n\n");
    fmt::print(fg(fmt::color::yellow) | fmt::emphasis::bold, "Goodbye.");
    fmt::print(" {}.\n\n", get_time_now_str());
    return exit_code;
}
} // anonymous namespace

/// @brief ITHIM host application entry point
/// @param argc The number of command arguments
/// @param argv The list of arguments provided
/// @return The application exit code
int main(int argc, char *argv[]) { // NOLINT(bugprone-exception-escape)
    using namespace ithim;
    using namespace ithim::input;

    // Create CLI options and validate minimum arguments
    auto options = create_options();
    if (argc < 2) {
        std::cout << options.help() << '\n';
        return exit_application(EXIT_FAILURE);
    }

    std::optional<CommandOptions> cmd_args_opt;
    try {
        cmd_args_opt = parse_arguments(options, argc, argv);

        // We won't get a config if e.g. the user chooses the --help option
        if (!cmd_args_opt) {
            return exit_application(EXIT_SUCCESS);
        }
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\nInvalid command line argument: {}\n", ex.what());
        fmt::print("\n{}\n", options.help());
        return exit_application(EXIT_FAILURE);
    }

    const auto &cmd_args = cmd_args_opt.value();
    auto threads = cmd_args.num_threads > 0
                       ? cmd_args.num_threads
                       : static_cast<size_t>(tbb::this_task_arena::max_concurrency());
    auto thread_control =
        tbb::global_control(tbb::global_control::max_allowed_parallelism, threads);

    print_app_title();

    // Parse inputs configuration file, *.json.
    Configuration config;
    try {
        config = get_configuration(cmd_args.config_file, cmd_args.output_folder, cmd_args.verbose);
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nInvalid configuration - {}.\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    // Create output folder
    if (!std::filesystem::exists(config.output.folder)) {
        fmt::print(fg(fmt::color::dark_salmon), "\nCreating output folder: {} ...\n",
                   config.output.folder);
        if (!std::filesystem::create_directories(config.output.folder)) {
            fmt::print(fg(fmt::color::red), "Failed to create output folder: {}\n",
                       config.output.folder);
            return exit_application(EXIT_FAILURE);
        }
    }

    try {
        auto start = std::chrono::steady_clock::now();
        auto model_options = create_model_options(config);
        if (!model_options.seed.has_value()) {
            // Both models share the seed, common random numbers across scenarios.
            model_options.seed = std::random_device{}();
        }

        auto baseline_parameters = create_baseline_parameters(config);
        auto scenario_parameters = create_scenario_parameters(config, baseline_parameters);

        fmt::print("Age classes: {}, diseases: {}, samples per stratum: {}.\n",
                   baseline_parameters.age_classes().size(), baseline_parameters.burden.size(),
                   model_options.sample_size);

        fmt::print(fg(fmt::color::cyan), "\nBuilding baseline model ...\n");
        auto baseline = Model(std::move(baseline_parameters), model_options);

        fmt::print(fg(fmt::color::cyan), "Building scenario model: {} ...\n",
                   config.scenario.name);
        auto scenario = Model(std::move(scenario_parameters), model_options);

        auto report = ModelComparator{}.compare(baseline, scenario);
        print_comparison(report, cmd_args);

        auto writer = ResultFileWriter{
            create_output_file_name(config.output),
            ExperimentInfo{.model = config.app_name,
                           .version = config.app_version,
                           .scenario = config.scenario.name,
                           .sample_size = model_options.sample_size,
                           .seed = model_options.seed.value_or(0u)}};
        writer.write(baseline, scenario, report);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        fmt::print(fg(fmt::color::light_green), "\nCompleted, elapsed time : {}\n", elapsed);
    } catch (const std::exception &ex) {
        fmt::print(fg(fmt::color::red), "\n\nFailed with message: {}.\n\n", ex.what());
        return exit_application(EXIT_FAILURE);
    }

    return exit_application(EXIT_SUCCESS);
}

// NOLINTBEGIN(modernize-concat-nested-namespaces)
/// @brief Top-level namespace for ITHIM Console host application
namespace ithim {
/// @brief Internal details namespace for private data types and functions
namespace detail {}
} // namespace ithim
// NOLINTEND(modernize-concat-nested-namespaces)
