#pragma once

#include <vector>

namespace ithim::core {

/// @brief Additional mathematical functions and determines the parameters of
///        the floating point representation.
///
/// References:
/// - William Cody, Algorithm 665: MACHAR, a subroutine to dynamically determine
///   machine parameters, ACM Transactions on Mathematical Software, Volume 14,
///   Number 4, December 1988, pages 303-311.
///
/// - Peter J. Acklam, An algorithm for computing the inverse normal cumulative
///   distribution function, 2003.
///
/// - Rob J. Hyndman and Yanan Fan, Sample Quantiles in Statistical Packages,
///   The American Statistician, Volume 50, Number 4, November 1996, pages 361-365.
class MathHelper {
  public:
    MathHelper() = delete;

    /// @brief Gets the machine radix used by floating-point numbers.
    /// @return The machine radix value
    static int radix() noexcept;

    /// @brief Gets the largest positive value which, when added to 1.0, yields 0.
    /// @return The machine precision value
    static double machine_precision() noexcept;

    /// @brief Gets the typical meaningful precision for numerical calculations.
    /// @return The default precision for numerical calculations
    static double default_numerical_precision() noexcept;

    /// @brief Compares two floating-point numbers for relative equality using
    ///        the default numerical precision.
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right) noexcept;

    /// @brief Compares two floating-point numbers for relative equality.
    ///
    /// Let <c>a</c> and <c>b</c> be the two numbers to be compared, the numbers
    /// are considered equal if <c>|a - b| / max(|a|, |b|)</c> is smaller than
    /// the given precision, or if both numbers are smaller than the precision.
    ///
    /// @param left The left double to compare.
    /// @param right The right double to compare.
    /// @param precision The comparison precision.
    /// @return <b>true</b> if the number are equal, otherwise. <b>false</b>
    static bool equal(double left, double right, double precision) noexcept;

    /// @brief Inverse of the standard normal cumulative distribution function
    ///
    /// Acklam's rational approximation refined with one step of Halley's method,
    /// giving full double precision over the open unit interval.
    ///
    /// @param probability The cumulative probability, in (0,1)
    /// @return The standard normal quantile
    /// @throws NumericDomainError for probability outside (0,1)
    static double normal_quantile(double probability);

    /// @brief Inverse of the lognormal cumulative distribution function
    /// @param probability The cumulative probability, in (0,1)
    /// @param location The log-scale location (mean of the logarithm)
    /// @param scale The log-scale scale (standard deviation of the logarithm)
    /// @return The lognormal quantile
    /// @throws NumericDomainError for probability outside (0,1)
    static double lognormal_quantile(double probability, double location, double scale);

    /// @brief Lognormal probability density function
    /// @param value The point to evaluate, zero or negative values have zero density
    /// @param location The log-scale location (mean of the logarithm)
    /// @param scale The log-scale scale (standard deviation of the logarithm)
    /// @return The density value
    static double lognormal_density(double value, double location, double scale) noexcept;

    /// @brief Empirical quantile of a sorted sample
    ///
    /// Linear interpolation between order statistics with <c>h = (n - 1)p</c>,
    /// definition 7 of Hyndman and Fan.
    ///
    /// @param sorted_sample The sample values in ascending order
    /// @param probability The cumulative probability, in [0,1]
    /// @return The sample quantile
    /// @throws std::invalid_argument for empty sample
    /// @throws NumericDomainError for probability outside [0,1]
    static double empirical_quantile(const std::vector<double> &sorted_sample,
                                     double probability);

  private:
    /// @brief Radix used by floating-point numbers.
    static int radix_;

    /// @brief Largest positive value which, when added to 1.0, yields 0 - Epsilon.
    static double machine_precision_;

    /// @brief Typical meaningful precision for numerical calculations.
    static double numerical_precision_;

    /// @brief Calculates the machine radix.
    static void compute_radix() noexcept;

    /// @brief Calculates the machine precision.
    static void compute_machine_precision() noexcept;
};
} // namespace ithim::core
