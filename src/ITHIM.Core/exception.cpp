#include "exception.h"

#include <fmt/format.h>

namespace ithim::core {

IthimException::IthimException(const std::string &what_arg, const source_location location)
    : std::runtime_error{what_arg}, location_{location} {
    what_arg_ = fmt::format("{}:{}: {}", file_name(), line(), std::runtime_error::what());
}

const char *IthimException::what() const noexcept { return what_arg_.c_str(); }

const char *IthimException::message() const noexcept { return std::runtime_error::what(); }

std::uint_least32_t IthimException::line() const noexcept { return location_.line(); }

const char *IthimException::file_name() const noexcept { return location_.file_name(); }

const char *IthimException::function_name() const noexcept {
    return location_.function_name();
}

InputFormatError::InputFormatError(const std::string &what_arg, const source_location location)
    : IthimException{what_arg, location} {}

ConfigurationError::ConfigurationError(const std::string &what_arg,
                                       const source_location location)
    : IthimException{what_arg, location} {}

MissingBurdenDataError::MissingBurdenDataError(const std::string &what_arg,
                                               const source_location location)
    : IthimException{what_arg, location} {}

NumericDomainError::NumericDomainError(const std::string &what_arg,
                                       const source_location location)
    : IthimException{what_arg, location} {}

} // namespace ithim::core
