#pragma once

#include "ITHIM/age_sex_table.h"
#include "ITHIM/disease_burden.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace ithim::input {

/// @brief Defines the stratified active transport time data type
struct ActiveTransportTime {
    /// @brief Walking time, minutes per week
    DoubleAgeSexTable walking;

    /// @brief Cycling time, minutes per week
    DoubleAgeSexTable cycling;
};

/// @brief Loads the active transport time file, columns: mode, ageClass, sex, value
///
/// @details Rows order matters, the age classes of each mode and sex must be
/// given in strictly increasing order and be the same for all modes and sexes.
///
/// @param file_name The file full path
/// @return The walking and cycling stratified tables
/// @throws core::InputFormatError for malformed or inconsistent file contents
ActiveTransportTime load_active_transport_time(const std::filesystem::path &file_name);

/// @brief Loads a stratified values file, columns: ageClass, sex, value
/// @param file_name The file full path
/// @return The stratified values table
/// @throws core::InputFormatError for malformed or inconsistent file contents
DoubleAgeSexTable load_age_sex_table(const std::filesystem::path &file_name);

/// @brief Loads the disease burden file, columns: disease, ageClass, sex, burdenType, value
///
/// @details Injury (RTIs) rows are outside the physical activity pathway and skipped.
///
/// @param file_name The file full path
/// @return The disease burden table
/// @throws core::InputFormatError for malformed file contents or unknown names
/// @throws core::MissingBurdenDataError for strata without both sexes
DiseaseBurdenTable load_disease_burden(const std::filesystem::path &file_name);

/// @brief Maps the required fields to their column index, case-insensitive
/// @param column_names The file column names
/// @param fields The required field names
/// @return The field name to column index mapping
/// @throws core::InputFormatError for missing required fields
std::map<std::string, std::size_t>
create_fields_index_mapping(const std::vector<std::string> &column_names,
                            const std::vector<std::string> &fields);
} // namespace ithim::input
