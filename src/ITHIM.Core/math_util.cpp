#include "math_util.h"
#include "exception.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include <fmt/format.h>

namespace ithim::core {
int MathHelper::radix_{0};
double MathHelper::machine_precision_{0.0};
double MathHelper::numerical_precision_{0.0};

int MathHelper::radix() noexcept {
    if (radix_ == 0) {
        compute_radix();
    }

    return radix_;
}

double MathHelper::machine_precision() noexcept {
    if (machine_precision_ == 0.0) {
        compute_machine_precision();
    }

    return machine_precision_;
}

double MathHelper::default_numerical_precision() noexcept {
    if (numerical_precision_ == 0.0) {
        numerical_precision_ = std::sqrt(machine_precision());
    }

    return numerical_precision_;
}

bool MathHelper::equal(double left, double right) noexcept {
    return equal(left, right, default_numerical_precision());
}

bool MathHelper::equal(double left, double right, double precision) noexcept {
    double norm = std::max(std::abs(left), std::abs(right));
    return norm < precision || std::abs(left - right) < precision * norm;
}

double MathHelper::normal_quantile(double probability) {
    if (!(probability > 0.0 && probability < 1.0)) {
        throw NumericDomainError(
            fmt::format("Quantile probability outside of (0,1), given: {}.", probability));
    }

    constexpr auto a = std::array<double, 6>{-3.969683028665376e+01, 2.209460984245205e+02,
                                             -2.759285104469687e+02, 1.383577518672690e+02,
                                             -3.066479806614716e+01, 2.506628277459239e+00};
    constexpr auto b = std::array<double, 5>{-5.447609879822406e+01, 1.615858368580409e+02,
                                             -1.556989798598866e+02, 6.680131188771972e+01,
                                             -1.328068155288572e+01};
    constexpr auto c = std::array<double, 6>{-7.784894002430293e-03, -3.223964580411365e-01,
                                             -2.400758277161838e+00, -2.549732539343734e+00,
                                             4.374664141464968e+00,  2.938163982698783e+00};
    constexpr auto d = std::array<double, 4>{7.784695709041462e-03, 3.224671290700398e-01,
                                             2.445134137142996e+00, 3.754408661907416e+00};
    constexpr auto p_low = 0.02425;
    constexpr auto p_high = 1.0 - p_low;

    double x = 0.0;
    if (probability < p_low) {
        auto q = std::sqrt(-2.0 * std::log(probability));
        x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    } else if (probability <= p_high) {
        auto q = probability - 0.5;
        auto r = q * q;
        x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
            (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    } else {
        auto q = std::sqrt(-2.0 * std::log(1.0 - probability));
        x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
            ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }

    // Halley's rational method, third order
    auto e = 0.5 * std::erfc(-x / std::numbers::sqrt2) - probability;
    auto u = e * std::sqrt(2.0 * std::numbers::pi) * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

double MathHelper::lognormal_quantile(double probability, double location, double scale) {
    return std::exp(location + scale * normal_quantile(probability));
}

double MathHelper::lognormal_density(double value, double location, double scale) noexcept {
    if (value <= 0.0 || scale <= 0.0) {
        return 0.0;
    }

    auto z = (std::log(value) - location) / scale;
    return std::exp(-0.5 * z * z) / (value * scale * std::sqrt(2.0 * std::numbers::pi));
}

double MathHelper::empirical_quantile(const std::vector<double> &sorted_sample,
                                      double probability) {
    if (sorted_sample.empty()) {
        throw std::invalid_argument("Empirical quantile of an empty sample.");
    }

    if (!(probability >= 0.0 && probability <= 1.0)) {
        throw NumericDomainError(
            fmt::format("Quantile probability outside of [0,1], given: {}.", probability));
    }

    auto h = static_cast<double>(sorted_sample.size() - 1) * probability;
    auto lower = static_cast<std::size_t>(std::floor(h));
    auto upper = std::min(lower + 1, sorted_sample.size() - 1);
    auto fraction = h - static_cast<double>(lower);
    return sorted_sample[lower] + fraction * (sorted_sample[upper] - sorted_sample[lower]);
}

void MathHelper::compute_radix() noexcept {
    auto a = 1.0;
    auto tmp1 = 0.0;
    auto tmp2 = 0.0;
    do {
        a += a;
        tmp1 = a + 1.0;
        tmp2 = tmp1 - a;
    } while (tmp2 - 1.0 != 0.0);

    auto b = 1.0;
    while (radix_ == 0) {
        b += b;
        tmp1 = a + b;
        radix_ = static_cast<int>(tmp1 - a);
    }
}

void MathHelper::compute_machine_precision() noexcept {
    auto real_radix = static_cast<double>(radix());
    auto inverse_radix = 1.0 / real_radix;

    machine_precision_ = 1.0;
    auto local_precision = 1.0 + machine_precision_;
    while (local_precision - 1.0 != 0.0) {
        machine_precision_ *= inverse_radix;
        local_precision = 1.0 + machine_precision_;
    }
}
} // namespace ithim::core
