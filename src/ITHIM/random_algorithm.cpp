#include "random_algorithm.h"

#include <cmath>
#include <stdexcept>

namespace ithim {
Random::Random(RandomBitGenerator &generator) : engine_{generator} {}

double Random::next_double() noexcept { return engine_.get().next_double(); }

double Random::next_normal() { return next_normal(0.0, 1.0); }

double Random::next_normal(double mean, double standard_deviation) {
    if (standard_deviation < 0.0) {
        throw std::invalid_argument("The standard deviation parameter must not be negative");
    }

    if (standard_deviation == 0.0) {
        return mean;
    }

    return next_normal_internal(mean, standard_deviation);
}

double Random::next_lognormal(double location, double scale) {
    if (scale < 0.0) {
        throw std::invalid_argument("The lognormal scale parameter must not be negative");
    }

    return std::exp(next_normal(location, scale));
}

double Random::next_uniform_internal(double min_value, double max_value) {
    return min_value + (max_value - min_value) * next_double();
}

double Random::next_normal_internal(double mean, double standard_deviation) {
    double p, p1, p2;
    do {
        p1 = next_uniform_internal(-1.0, 1.0);
        p2 = next_uniform_internal(-1.0, 1.0);
        p = p1 * p1 + p2 * p2;
    } while (p >= 1.0 || p == 0.0);

    return mean + standard_deviation * p1 * std::sqrt(-2.0 * std::log(p) / p);
}
} // namespace ithim
