#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// HACK: Clang 14 does not support std::source_location.
#if defined(__clang__) && __clang_major__ <= 14
#include <experimental/source_location>
using std::experimental::source_location;
#else
#include <source_location>
using std::source_location;
#endif // defined(__clang__) && __clang_major__ <= 14

namespace ithim::core {

/// @brief ITHIM base exception class, with source location information
class IthimException : public std::runtime_error {
  public:
    /// @brief Construct a new IthimException
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    IthimException(const std::string &what_arg,
                   const source_location location = source_location::current());

    /// @brief Gets the exception message prefixed with the source location
    /// @return The exception message
    const char *what() const noexcept override;

    /// @brief Gets the exception message without the source location
    /// @return The original message
    const char *message() const noexcept;

    /// @brief Gets the exception source location line
    /// @return The location line
    std::uint_least32_t line() const noexcept;

    /// @brief Gets the exception source location file name
    /// @return The location file name
    const char *file_name() const noexcept;

    /// @brief Gets the exception source location function name
    /// @return The location function name
    const char *function_name() const noexcept;

  private:
    source_location location_;
    std::string what_arg_;
};

/// @brief Malformed input data: stratum count mismatch, non-increasing age classes, bad rows
class InputFormatError : public IthimException {
  public:
    InputFormatError(const std::string &what_arg,
                     const source_location location = source_location::current());
};

/// @brief Invalid option: unknown mean type, burden type or disease filter
class ConfigurationError : public IthimException {
  public:
    ConfigurationError(const std::string &what_arg,
                       const source_location location = source_location::current());
};

/// @brief A disease, stratum or burden type combination is absent from the burden table
class MissingBurdenDataError : public IthimException {
  public:
    MissingBurdenDataError(const std::string &what_arg,
                           const source_location location = source_location::current());
};

/// @brief A numerical value outside of the function domain, e.g. a probability outside (0,1)
class NumericDomainError : public IthimException {
  public:
    NumericDomainError(const std::string &what_arg,
                       const source_location location = source_location::current());
};

} // namespace ithim::core
