#include "csvparser.h"
#include <rapidcsv.h>

#include "ITHIM.Core/exception.h"
#include "ITHIM.Core/scoped_timer.h"
#include "ITHIM.Core/string_util.h"
#include "ITHIM/model_parameters.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>

#if ITHIM_USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    ithim::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {

namespace ic = ithim::core;

using StratumRows = std::vector<std::pair<int, double>>;

struct SexRows {
    StratumRows males;
    StratumRows females;
};

rapidcsv::Document open_document(const std::filesystem::path &file_name) {
    if (!std::filesystem::exists(file_name)) {
        throw std::runtime_error(fmt::format("Input file: '{}' not found.", file_name.string()));
    }

    return rapidcsv::Document(file_name.string());
}

ic::Gender parse_sex(const std::string &value, std::size_t row) {
    auto sex = ic::trim(value);
    if (ic::case_insensitive::equals(sex, "M") || ic::case_insensitive::equals(sex, "male")) {
        return ic::Gender::male;
    }

    if (ic::case_insensitive::equals(sex, "F") || ic::case_insensitive::equals(sex, "female")) {
        return ic::Gender::female;
    }

    throw ic::InputFormatError(fmt::format("Row {}: unknown sex value '{}'.", row + 1, value));
}

int parse_age_class(const std::string &value, std::size_t row) {
    try {
        return std::stoi(ic::trim(value));
    } catch (const std::logic_error &) {
        throw ic::InputFormatError(
            fmt::format("Row {}: invalid age class value '{}'.", row + 1, value));
    }
}

double parse_value(const std::string &value, std::size_t row) {
    try {
        return std::stod(ic::trim(value));
    } catch (const std::logic_error &) {
        throw ic::InputFormatError(fmt::format("Row {}: invalid numeric value '{}'.", row + 1, value));
    }
}

void append_row(SexRows &rows, ic::Gender sex, int age_class, double value) {
    if (sex == ic::Gender::male) {
        rows.males.emplace_back(age_class, value);
    } else {
        rows.females.emplace_back(age_class, value);
    }
}

std::vector<int> age_classes_of(const StratumRows &rows) {
    auto result = std::vector<int>{};
    result.reserve(rows.size());
    for (const auto &row : rows) {
        result.emplace_back(row.first);
    }

    return result;
}

ithim::DoubleAgeSexTable create_table(const SexRows &rows, std::string_view name) {
    auto age_classes = age_classes_of(rows.males);
    if (age_classes.empty()) {
        throw ic::InputFormatError(fmt::format("The {} values are empty.", name));
    }

    if (!ithim::is_strictly_increasing(age_classes)) {
        throw ic::InputFormatError(
            fmt::format("The {} age classes must be given in strictly increasing order: {}.", name,
                        fmt::join(age_classes, ", ")));
    }

    if (age_classes != age_classes_of(rows.females)) {
        throw ic::InputFormatError(
            fmt::format("The {} males and females age classes mismatch.", name));
    }

    auto table = ithim::DoubleAgeSexTable(ithim::MonotonicVector<int>(age_classes));
    for (std::size_t i = 0; i < rows.males.size(); i++) {
        table.at(rows.males[i].first, ic::Gender::male) = rows.males[i].second;
        table.at(rows.females[i].first, ic::Gender::female) = rows.females[i].second;
    }

    return table;
}
} // anonymous namespace

namespace ithim::input {

ActiveTransportTime load_active_transport_time(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_document(file_name);
    auto mapping =
        create_fields_index_mapping(doc.GetColumnNames(), {"mode", "ageClass", "sex", "value"});

    auto data = std::map<ActivityMode, SexRows>{};
    for (std::size_t i = 0; i < doc.GetRowCount(); i++) {
        auto row = doc.GetRow<std::string>(i);
        auto mode = parse_activity_mode(core::trim(row[mapping["mode"]]));
        append_row(data[mode], parse_sex(row[mapping["sex"]], i),
                   parse_age_class(row[mapping["ageClass"]], i),
                   parse_value(row[mapping["value"]], i));
    }

    if (!data.contains(ActivityMode::walking) || !data.contains(ActivityMode::cycling)) {
        throw core::InputFormatError(fmt::format(
            "Active transport file: '{}' must have walking and cycling rows.", file_name.string()));
    }

    auto walking = create_table(data.at(ActivityMode::walking), "walking time");
    auto cycling = create_table(data.at(ActivityMode::cycling), "cycling time");
    if (!walking.same_strata(cycling)) {
        throw core::InputFormatError(
            fmt::format("Active transport file: '{}' walking and cycling age classes mismatch.",
                        file_name.string()));
    }

    return ActiveTransportTime{.walking = std::move(walking), .cycling = std::move(cycling)};
}

DoubleAgeSexTable load_age_sex_table(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_document(file_name);
    auto mapping = create_fields_index_mapping(doc.GetColumnNames(), {"ageClass", "sex", "value"});

    auto data = SexRows{};
    for (std::size_t i = 0; i < doc.GetRowCount(); i++) {
        auto row = doc.GetRow<std::string>(i);
        append_row(data, parse_sex(row[mapping["sex"]], i),
                   parse_age_class(row[mapping["ageClass"]], i),
                   parse_value(row[mapping["value"]], i));
    }

    return create_table(data, file_name.filename().string());
}

DiseaseBurdenTable load_disease_burden(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_document(file_name);
    auto mapping = create_fields_index_mapping(
        doc.GetColumnNames(), {"disease", "ageClass", "sex", "burdenType", "value"});

    auto data = std::map<std::pair<DiseaseType, BurdenType>, SexRows>{};
    for (std::size_t i = 0; i < doc.GetRowCount(); i++) {
        auto row = doc.GetRow<std::string>(i);
        auto disease_name = core::trim(row[mapping["disease"]]);
        if (is_injury_disease(disease_name)) {
            continue;
        }

        DiseaseType disease;
        BurdenType burden;
        try {
            disease = parse_disease_type(disease_name);
            burden = parse_burden_type(core::trim(row[mapping["burdenType"]]));
        } catch (const core::ConfigurationError &ex) {
            throw core::InputFormatError(fmt::format("Row {}: {}", i + 1, ex.message()));
        }

        append_row(data[{disease, burden}], parse_sex(row[mapping["sex"]], i),
                   parse_age_class(row[mapping["ageClass"]], i),
                   parse_value(row[mapping["value"]], i));
    }

    auto result = DiseaseBurdenTable{};
    for (const auto &[key, rows] : data) {
        auto name = fmt::format("{} {} burden", to_string(key.first), to_string(key.second));
        if (rows.males.size() != rows.females.size()) {
            throw core::MissingBurdenDataError(
                fmt::format("The {} must have both sexes for every age class.", name));
        }

        result.add(key.first, key.second, create_table(rows, name));
    }

    return result;
}

std::map<std::string, std::size_t>
create_fields_index_mapping(const std::vector<std::string> &column_names,
                            const std::vector<std::string> &fields) {
    auto mapping = std::map<std::string, std::size_t>();
    for (const auto &field : fields) {
        auto field_index = core::case_insensitive::index_of(column_names, field);
        if (field_index < 0) {
            throw core::InputFormatError(fmt::format("Required field {} not found", field));
        }

        mapping.emplace(field, static_cast<std::size_t>(field_index));
    }

    return mapping;
}
} // namespace ithim::input
