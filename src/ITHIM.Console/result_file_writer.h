#pragma once
#include <filesystem>
#include <fstream>

#include "ITHIM/model.h"
#include "ITHIM/model_comparator.h"
#include "model_info.h"

#include <nlohmann/json.hpp>

namespace ithim {
/// @brief Defines the comparison results file stream writer class
///
/// The experiment information, per-disease attributable fractions and the
/// stratified burden changes are written to a JSON (JavaScript Object Notation)
/// file, while the burden changes are also written to an associated CSV
/// (Comma-separated Values) file with same name but different extension.
class ResultFileWriter final {
  public:
    ResultFileWriter() = delete;
    /// @brief Initialises an instance of the ithim::ResultFileWriter class.
    /// @param file_name The JSON output file full name
    /// @param info The associated experiment information
    ResultFileWriter(const std::filesystem::path &file_name, ExperimentInfo info);

    ResultFileWriter(const ResultFileWriter &) = delete;
    ResultFileWriter &operator=(const ResultFileWriter &) = delete;
    ResultFileWriter(ResultFileWriter &&other) noexcept = default;
    ResultFileWriter &operator=(ResultFileWriter &&other) noexcept = default;

    /// @brief Destroys a ithim::ResultFileWriter instance
    ~ResultFileWriter();

    /// @brief Writes the models comparison results
    /// @param baseline The baseline model
    /// @param scenario The scenario model
    /// @param report The comparison report
    void write(const Model &baseline, const Model &scenario, const ComparisonReport &report);

    /// @brief Creates the JSON document for a comparison results
    /// @param info The experiment information
    /// @param baseline The baseline model
    /// @param scenario The scenario model
    /// @param report The comparison report
    /// @return The results JSON document
    static nlohmann::json to_json(const ExperimentInfo &info, const Model &baseline,
                                  const Model &scenario, const ComparisonReport &report);

  private:
    std::ofstream stream_;
    std::ofstream csvstream_;
    ExperimentInfo info_;

    void write_csv(const ComparisonReport &report);
};
} // namespace ithim
