#pragma once
#include <cstdint>
#include <type_traits>

// forward type declaration
namespace ithim::core {

/// @brief Verbosity mode enumeration
enum class VerboseMode : uint8_t {
    /// @brief only report errors
    none,

    /// @brief Print more information about actions, including warning
    verbose
};

/// @brief Enumerates gender types
enum class Gender : uint8_t {
    /// @brief Unknown gender
    unknown,

    /// @brief Male
    male,

    /// @brief Female
    female
};

/// @brief C++20 concept for numeric columns types
template <typename T>
concept Numerical = std::is_arithmetic_v<T>;

} // namespace ithim::core
