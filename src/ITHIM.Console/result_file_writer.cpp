#include "result_file_writer.h"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace {

nlohmann::json stratum_to_json(const ithim::DoubleAgeSexTable &table) {
    using ithim::core::Gender;

    auto result = nlohmann::json::object();
    for (const auto &age_class : table.age_classes()) {
        result[std::to_string(age_class)] = {{"male", table.at(age_class, Gender::male)},
                                             {"female", table.at(age_class, Gender::female)}};
    }

    return result;
}

nlohmann::json quantiles_to_json(const ithim::QuantileTable &table) {
    using ithim::core::Gender;

    auto result = nlohmann::json::object();
    for (const auto &age_class : table.age_classes()) {
        auto males = std::vector<double>{};
        auto females = std::vector<double>{};
        for (std::size_t q = 0; q < table.columns(); q++) {
            males.emplace_back(table.at(age_class, Gender::male, q));
            females.emplace_back(table.at(age_class, Gender::female, q));
        }

        result[std::to_string(age_class)] = {{"male", males}, {"female", females}};
    }

    return result;
}

nlohmann::json means_to_json(const ithim::Model &model) {
    const auto &means = model.means();
    return {{"mean_type", ithim::to_string(model.parameters().mean_type)},
            {"walking_time", stratum_to_json(means.walking_time)},
            {"cycling_time", stratum_to_json(means.cycling_time)},
            {"non_travel", stratum_to_json(means.non_travel)},
            {"total_met", quantiles_to_json(model.quantiles().total_met)}};
}
} // anonymous namespace

namespace ithim {
ResultFileWriter::ResultFileWriter(const std::filesystem::path &file_name, ExperimentInfo info)
    : info_{std::move(info)} {
    stream_.open(file_name, std::ofstream::out | std::ofstream::trunc);
    if (stream_.fail() || !stream_.is_open()) {
        throw std::invalid_argument(fmt::format("Cannot open output file: {}", file_name.string()));
    }

    auto output_filename = file_name;
    output_filename.replace_extension("csv");
    csvstream_.open(output_filename, std::ofstream::out | std::ofstream::trunc);
    if (csvstream_.fail() || !csvstream_.is_open()) {
        throw std::invalid_argument(
            fmt::format("Cannot open output file: {}", output_filename.string()));
    }
}

ResultFileWriter::~ResultFileWriter() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }

    if (csvstream_.is_open()) {
        csvstream_.flush();
        csvstream_.close();
    }
}

void ResultFileWriter::write(const Model &baseline, const Model &scenario,
                             const ComparisonReport &report) {
    stream_ << to_json(info_, baseline, scenario, report).dump(2) << '\n';
    stream_.flush();
    write_csv(report);
}

nlohmann::json ResultFileWriter::to_json(const ExperimentInfo &info, const Model &baseline,
                                         const Model &scenario, const ComparisonReport &report) {
    auto tp = std::chrono::system_clock::now();
    auto msg = nlohmann::json{
        {"experiment",
         {{"model", info.model},
          {"version", info.version},
          {"scenario", info.scenario},
          {"sample_size", info.sample_size},
          {"seed", info.seed},
          {"quantiles", baseline.parameters().quantiles},
          {"time_of_day", fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch())}}},
        {"baseline", means_to_json(baseline)},
        {"scenario", means_to_json(scenario)},
    };

    for (const auto &burden : all_burden_types) {
        msg["total_delta"][to_string(burden)] = report.delta_burden(burden);
    }

    for (const auto &disease : report.diseases()) {
        const auto &item = report.at(disease);
        auto name = to_string(disease);
        msg["diseases"][name]["attributable_fraction"] =
            stratum_to_json(item.risk.attributable_fraction);
        msg["diseases"][name]["alternative_attributable_fraction"] =
            stratum_to_json(item.risk.alternative_attributable_fraction);
        for (const auto &[burden, table] : item.delta) {
            msg["diseases"][name]["delta"][to_string(burden)] = {{"total", table.sum()},
                                                                 {"strata", stratum_to_json(table)}};
        }
    }

    return msg;
}

void ResultFileWriter::write_csv(const ComparisonReport &report) {
    using core::Gender;

    const auto *sep = ",";
    csvstream_ << "disease,burden_type,age_class,sex,attributable_fraction,delta" << '\n';
    for (const auto &disease : report.diseases()) {
        const auto &item = report.at(disease);
        for (const auto &[burden, table] : item.delta) {
            for (const auto &age_class : table.age_classes()) {
                for (const auto &gender : stratum_genders) {
                    csvstream_ << to_string(disease) << sep << to_string(burden) << sep
                               << age_class << sep << (gender == Gender::male ? "male" : "female")
                               << sep << item.risk.attributable_fraction.at(age_class, gender)
                               << sep << table.at(age_class, gender) << '\n';
                }
            }
        }
    }

    csvstream_.flush();
}
} // namespace ithim
