#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace ithim::core {

/// @brief Trim leading and trailing occurrences of white-space characters from string.
/// @param value The string to trim
/// @return The resulting string
std::string trim(std::string value) noexcept;

/// @brief Converts the given ASCII string to lower-case
/// @param value The string to convert
/// @return The string in lower-case
std::string to_lower(const std::string_view &value) noexcept;

/// @brief Case-insensitive operations on ASCII strings.
struct case_insensitive final {

    /// @brief Compare two case-insensitive ASCII string for equality
    /// @param left The left string to compare
    /// @param right The right string to compare
    /// @return true if the string are equal, otherwise, false
    static bool equals(const std::string_view &left, const std::string_view &right) noexcept;

    /// @brief Finds the zero-based index of the first occurrence of an element in a vector.
    /// @param source The vector of strings
    /// @param element The element to locate
    /// @return The zero-based index the element first occurrence, if found; otherwise, -1.
    static int index_of(const std::vector<std::string> &source,
                        const std::string_view &element) noexcept;

  private:
    static bool equal_char(char left, char right) noexcept;
};
} // namespace ithim::core
