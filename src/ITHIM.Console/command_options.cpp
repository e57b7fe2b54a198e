#include "command_options.h"
#include "version.h"

#include <fmt/color.h>

#include <iostream>
#include <stdexcept>

namespace ithim {

cxxopts::Options create_options() {
    cxxopts::Options options("ITHIM.Console",
                             "ITHIM physical activity comparative risk assessment.");

    // clang-format off
    options.add_options()
        ("c,config", "Path to configuration file.", cxxopts::value<std::string>())
        ("o,output", "Path to output folder", cxxopts::value<std::string>())
        ("T,threads", "The maximum number of threads to create (0: no limit, default).",
            cxxopts::value<size_t>())
        ("burden", "The burden type to report: deaths, yll, yld or daly.",
            cxxopts::value<std::string>()->default_value("daly"))
        ("disease", "The disease to report, or all diseases.",
            cxxopts::value<std::string>()->default_value("all"))
        ("verbose", "Print more information about progress",
            cxxopts::value<bool>()->default_value("false"))
        ("help", "Help for this application.")
        ("version", "Print the application version number.");
    // clang-format on

    return options;
}

std::optional<CommandOptions> parse_arguments(cxxopts::Options &options, int argc, char **argv) {
    CommandOptions cmd;
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    if (result.count("version")) {
        fmt::print("Version {}\n\n", PROJECT_VERSION);
        return std::nullopt;
    }

    cmd.verbose = result["verbose"].as<bool>();
    if (cmd.verbose) {
        fmt::print(fg(fmt::color::dark_salmon), "Verbose output enabled\n");
    }

    if (!result.count("config")) {
        throw std::runtime_error("The configuration file argument is required.");
    }

    cmd.config_file = result["config"].as<std::string>();
    fmt::print("Configuration file: {}\n", cmd.config_file);

    if (result.count("output")) {
        cmd.output_folder = result["output"].as<std::string>();
    }

    if (result.count("threads")) {
        cmd.num_threads = result["threads"].as<size_t>();
    }

    cmd.burden = result["burden"].as<std::string>();
    cmd.disease = result["disease"].as<std::string>();
    return cmd;
}
} // namespace ithim
