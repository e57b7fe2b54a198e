#pragma once

#include "randombit_generator.h"
#include <functional>

namespace ithim {
/// @brief General purpose Random number generator algorithms
class Random {
  public:
    Random() = delete;
    /// @brief Initialise a new instance of the Random class
    /// @param generator Underline pseudo-random number engine instance
    Random(RandomBitGenerator &generator);

    /// @brief Generates a random floating point number in range [0,1)
    /// @return A floating point value in range [0,1).
    double next_double() noexcept;

    /// @brief Generates the next random number from a standard normal distribution
    /// @return The generated floating point random number
    double next_normal();

    /// @brief Generates the next random number from a normal distribution
    /// @param mean The mean parameter
    /// @param standard_deviation The standard deviation parameter
    /// @return The generated floating point random number
    /// @throws std::invalid_argument for negative standard deviation
    double next_normal(double mean, double standard_deviation);

    /// @brief Generates the next random number from a lognormal distribution
    /// @param location The log-scale location parameter
    /// @param scale The log-scale scale parameter, zero yields a degenerate distribution
    /// @return The generated positive floating point random number
    /// @throws std::invalid_argument for negative scale
    double next_lognormal(double location, double scale);

  private:
    std::reference_wrapper<RandomBitGenerator> engine_;
    double next_uniform_internal(double min_value, double max_value);
    double next_normal_internal(double mean, double standard_deviation);
};
} // namespace ithim
