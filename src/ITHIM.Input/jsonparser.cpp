#include "jsonparser.h"

namespace {

// Reads an optional key, a missing or null value leaves the output empty
template <typename T>
void get_optional(const nlohmann::json &j, const char *key, std::optional<T> &out) {
    if (j.contains(key)) {
        j.at(key).get_to(out);
    }
}
} // anonymous namespace

namespace ithim::input::poco {

// Baseline exposure
void to_json(json &j, const ExposureInfo &p) {
    j = json{{"mean_type", p.mean_type},
             {"mean_walking_time", p.mean_walking_time},
             {"mean_cycling_time", p.mean_cycling_time},
             {"mean_non_travel", p.mean_non_travel},
             {"travel_cv", p.travel_cv},
             {"non_travel_cv", p.non_travel_cv}};
}

void from_json(const json &j, ExposureInfo &p) {
    j.at("mean_type").get_to(p.mean_type);
    j.at("mean_walking_time").get_to(p.mean_walking_time);
    j.at("mean_cycling_time").get_to(p.mean_cycling_time);
    j.at("mean_non_travel").get_to(p.mean_non_travel);
    j.at("travel_cv").get_to(p.travel_cv);
    j.at("non_travel_cv").get_to(p.non_travel_cv);
}

// Scenario overrides
void to_json(json &j, const ScenarioInfo &p) {
    j = json{{"name", p.name},
             {"mean_type", p.mean_type},
             {"mean_walking_time", p.mean_walking_time},
             {"mean_cycling_time", p.mean_cycling_time},
             {"mean_non_travel", p.mean_non_travel},
             {"travel_cv", p.travel_cv},
             {"non_travel_cv", p.non_travel_cv}};

    if (p.active_transport.has_value()) {
        j["active_transport"] = p.active_transport.value().string();
    }
}

void from_json(const json &j, ScenarioInfo &p) {
    j.at("name").get_to(p.name);
    get_optional(j, "mean_type", p.mean_type);
    get_optional(j, "mean_walking_time", p.mean_walking_time);
    get_optional(j, "mean_cycling_time", p.mean_cycling_time);
    get_optional(j, "mean_non_travel", p.mean_non_travel);
    get_optional(j, "travel_cv", p.travel_cv);
    get_optional(j, "non_travel_cv", p.non_travel_cv);

    std::optional<std::string> file_name;
    get_optional(j, "active_transport", file_name);
    if (file_name.has_value()) {
        p.active_transport = std::filesystem::path{file_name.value()};
    }
}

// Run-time options
void to_json(json &j, const RunningInfo &p) {
    j = json{{"seed", p.seed},
             {"sample_size", p.sample_size},
             {"quantiles", p.quantiles},
             {"walking_met", p.walking_met},
             {"cycling_met", p.cycling_met},
             {"exponent", p.exponent}};
}

void from_json(const json &j, RunningInfo &p) {
    get_optional(j, "seed", p.seed);
    if (j.contains("sample_size")) {
        j.at("sample_size").get_to(p.sample_size);
    }

    if (j.contains("quantiles")) {
        j.at("quantiles").get_to(p.quantiles);
    }

    get_optional(j, "walking_met", p.walking_met);
    get_optional(j, "cycling_met", p.cycling_met);
    get_optional(j, "exponent", p.exponent);
}

// Output information
void to_json(json &j, const OutputInfo &p) {
    j = json{{"folder", p.folder}, {"file_name", p.file_name}};
}

void from_json(const json &j, OutputInfo &p) {
    j.at("folder").get_to(p.folder);
    j.at("file_name").get_to(p.file_name);
}
} // namespace ithim::input::poco
