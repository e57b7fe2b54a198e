#pragma once
#include "poco.h"

#include <nlohmann/json.hpp>
#include <optional>

namespace ithim::input::poco {
/// @brief JSON parser namespace alias.
///
/// Configuration file serialisation / de-serialisation mapping specific
/// to the `JSON for Modern C++` library adopted by the project.
///
/// @sa https://github.com/nlohmann/json#arbitrary-types-conversions
/// for details about the contents and code structure in this file.
using json = nlohmann::json;

//--------------------------------------------------------
// Configuration sections POCO types mapping
//--------------------------------------------------------

// Baseline exposure
void to_json(json &j, const ExposureInfo &p);
void from_json(const json &j, ExposureInfo &p);

// Scenario overrides
void to_json(json &j, const ScenarioInfo &p);
void from_json(const json &j, ScenarioInfo &p);

// Run-time options
void to_json(json &j, const RunningInfo &p);
void from_json(const json &j, RunningInfo &p);

// Output information
void to_json(json &j, const OutputInfo &p);
void from_json(const json &j, OutputInfo &p);
} // namespace ithim::input::poco

namespace std {

// Optional parameters
template <typename T> void to_json(nlohmann::json &j, const std::optional<T> &p) {
    if (p) {
        j = *p;
    } else {
        j = nullptr;
    }
}

template <typename T> void from_json(const nlohmann::json &j, std::optional<T> &p) {
    if (j.is_null()) {
        p = std::nullopt;
    } else {
        p = j.get<T>();
    }
}
} // namespace std
