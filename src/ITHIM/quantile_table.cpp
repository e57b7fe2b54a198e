#include "quantile_table.h"

namespace ithim {

QuantileTable::QuantileTable(const MonotonicVector<int> &age_classes,
                             const MonotonicVector<double> &quantiles)
    : age_classes_{age_classes.values()}, quantiles_{quantiles.values()},
      males_{age_classes.size(), quantiles.size(), 0.0},
      females_{age_classes.size(), quantiles.size(), 0.0} {
    for (std::size_t index = 0; index < age_classes_.size(); index++) {
        rows_index_.emplace(age_classes_[index], index);
    }
}

std::size_t QuantileTable::rows() const noexcept { return age_classes_.size(); }

std::size_t QuantileTable::columns() const noexcept { return quantiles_.size(); }

bool QuantileTable::empty() const noexcept { return rows_index_.empty(); }

const std::vector<int> &QuantileTable::age_classes() const noexcept { return age_classes_; }

const std::vector<double> &QuantileTable::quantiles() const noexcept { return quantiles_; }

double &QuantileTable::at(int age_class, core::Gender gender, std::size_t quantile) {
    return gender_values(gender)(rows_index_.at(age_class), quantile);
}

const double &QuantileTable::at(int age_class, core::Gender gender,
                                std::size_t quantile) const {
    return values(gender)(rows_index_.at(age_class), quantile);
}

double QuantileTable::row_sum(int age_class, core::Gender gender) const {
    return values(gender).row_sum(rows_index_.at(age_class));
}

DoubleAgeSexTable QuantileTable::row_sums() const {
    auto result = DoubleAgeSexTable(MonotonicVector<int>(age_classes_));
    for (const auto &age_class : age_classes_) {
        for (const auto &gender : stratum_genders) {
            result.at(age_class, gender) = row_sum(age_class, gender);
        }
    }

    return result;
}

const core::DoubleArray2D &QuantileTable::values(core::Gender gender) const {
    return gender_column(gender) == 0 ? males_ : females_;
}

bool QuantileTable::same_shape(const QuantileTable &other) const noexcept {
    return age_classes_ == other.age_classes_ && quantiles_ == other.quantiles_;
}

bool QuantileTable::operator==(const QuantileTable &rhs) const {
    return same_shape(rhs) && males_ == rhs.males_ && females_ == rhs.females_;
}

core::DoubleArray2D &QuantileTable::gender_values(core::Gender gender) {
    return gender_column(gender) == 0 ? males_ : females_;
}
} // namespace ithim
