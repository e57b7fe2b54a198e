#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace ithim::core {

std::string trim(std::string value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }

    std::size_t pos = 0;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
        ++pos;
    }

    return value.substr(pos);
}

std::string to_lower(const std::string_view &value) noexcept {
    std::string result = std::string(value);
    std::transform(value.begin(), value.end(), result.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    return result;
}

bool case_insensitive::equal_char(char left, char right) noexcept {
    return left == right || std::tolower(static_cast<unsigned char>(left)) ==
                                std::tolower(static_cast<unsigned char>(right));
}

bool case_insensitive::equals(const std::string_view &left,
                              const std::string_view &right) noexcept {
    return left.size() == right.size() &&
           std::equal(left.cbegin(), left.cend(), right.cbegin(), right.cend(), equal_char);
}

int case_insensitive::index_of(const std::vector<std::string> &source,
                               const std::string_view &element) noexcept {
    auto it = std::find_if(source.cbegin(), source.cend(), [&element](const std::string &other) {
        return case_insensitive::equals(element, other);
    });

    if (it != source.cend()) {
        return static_cast<int>(std::distance(source.cbegin(), it));
    }

    return -1;
}
} // namespace ithim::core
