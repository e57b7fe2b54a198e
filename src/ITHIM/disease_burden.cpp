#include "disease_burden.h"

#include "ITHIM.Core/exception.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ithim {

std::size_t DiseaseBurdenTable::size() const noexcept {
    auto count = std::size_t{0};
    for (const auto &entry : data_) {
        count += entry.second.size();
    }

    return count;
}

bool DiseaseBurdenTable::empty() const noexcept { return data_.empty(); }

void DiseaseBurdenTable::add(DiseaseType disease, BurdenType burden, DoubleAgeSexTable values) {
    if (values.empty()) {
        throw core::InputFormatError(fmt::format("Empty {} {} burden values.",
                                                 to_string(disease), to_string(burden)));
    }

    if (age_classes_.empty()) {
        age_classes_ = values.age_classes();
    } else if (age_classes_ != values.age_classes()) {
        throw core::InputFormatError(
            fmt::format("The {} {} burden age classes do not match the burden table.",
                        to_string(disease), to_string(burden)));
    }

    data_[disease].insert_or_assign(burden, std::move(values));
}

bool DiseaseBurdenTable::contains(DiseaseType disease) const noexcept {
    return data_.contains(disease);
}

bool DiseaseBurdenTable::contains(DiseaseType disease, BurdenType burden) const noexcept {
    auto it = data_.find(disease);
    return it != data_.end() && it->second.contains(burden);
}

const DoubleAgeSexTable &DiseaseBurdenTable::at(DiseaseType disease, BurdenType burden) const {
    auto it = data_.find(disease);
    if (it == data_.end()) {
        throw core::MissingBurdenDataError(
            fmt::format("Disease {} not found in the disease burden table.", to_string(disease)));
    }

    auto table_it = it->second.find(burden);
    if (table_it == it->second.end()) {
        throw core::MissingBurdenDataError(fmt::format("Burden type {} not found for disease {}.",
                                                       to_string(burden), to_string(disease)));
    }

    return table_it->second;
}

double DiseaseBurdenTable::at(DiseaseType disease, BurdenType burden, int age_class,
                              core::Gender gender) const {
    const auto &table = at(disease, burden);
    if (!table.contains(age_class, gender)) {
        throw core::MissingBurdenDataError(
            fmt::format("Stratum age class {} not found for disease {} {} burden.", age_class,
                        to_string(disease), to_string(burden)));
    }

    return table.at(age_class, gender);
}

std::vector<DiseaseType> DiseaseBurdenTable::diseases() const {
    auto result = std::vector<DiseaseType>{};
    result.reserve(data_.size());
    for (const auto &entry : data_) {
        result.emplace_back(entry.first);
    }

    return result;
}

const std::vector<int> &DiseaseBurdenTable::age_classes() const noexcept { return age_classes_; }

double DiseaseBurdenTable::total(BurdenType burden, std::optional<DiseaseType> disease) const {
    if (disease.has_value()) {
        return at(disease.value(), burden).sum();
    }

    auto sum = 0.0;
    for (const auto &entry : data_) {
        sum += at(entry.first, burden).sum();
    }

    return sum;
}

void DiseaseBurdenTable::validate(const std::vector<int> &age_classes) const {
    if (data_.empty()) {
        throw core::MissingBurdenDataError("The disease burden table is empty.");
    }

    if (age_classes_ != age_classes) {
        throw core::MissingBurdenDataError(
            fmt::format("Disease burden age classes [{}] do not match the model age classes [{}].",
                        fmt::join(age_classes_, ", "), fmt::join(age_classes, ", ")));
    }

    for (const auto &entry : data_) {
        for (const auto &burden : all_burden_types) {
            if (!entry.second.contains(burden)) {
                throw core::MissingBurdenDataError(
                    fmt::format("Burden type {} not found for disease {}.", to_string(burden),
                                to_string(entry.first)));
            }
        }
    }
}
} // namespace ithim
