#include "pch.h"
#include "temp_dir.h"

#include "ITHIM.Core/exception.h"
#include "ITHIM.Input/configuration.h"
#include "ITHIM.Input/configuration_parsing.h"
#include "ITHIM.Input/configuration_parsing_helpers.h"
#include "ITHIM.Input/jsonparser.h"

#include <cstdlib>
#include <sstream>

using json = nlohmann::json;
using namespace ithim::input;

namespace {
constexpr auto *ACTIVE_TRANSPORT = "mode,ageClass,sex,value\n"
                                   "walking,1,M,1.0\n"
                                   "walking,2,M,1.2\n"
                                   "walking,1,F,0.9\n"
                                   "walking,2,F,1.1\n"
                                   "cycling,1,M,1.5\n"
                                   "cycling,2,M,0.8\n"
                                   "cycling,1,F,0.6\n"
                                   "cycling,2,F,0.4\n";

constexpr auto *POPULATION_SHARE = "ageClass,sex,value\n"
                                   "1,M,0.25\n"
                                   "2,M,0.25\n"
                                   "1,F,0.25\n"
                                   "2,F,0.25\n";

std::string create_burden_csv() {
    auto ss = std::stringstream{};
    ss << "disease,ageClass,sex,burdenType,value\n";
    for (const auto *burden : {"deaths", "yll", "yld", "daly"}) {
        for (const auto *sex : {"M", "F"}) {
            for (auto age = 1; age <= 2; age++) {
                ss << "CVD," << age << ',' << sex << ',' << burden << ',' << 100.0 * age << '\n';
            }
        }
    }

    return ss.str();
}

json create_config() {
    return json::parse(R"(
        {
            "version": 1,
            "inputs": {
                "active_transport": "active_transport.csv",
                "population_share": "population_share.csv",
                "disease_burden": "gbd.csv"
            },
            "baseline": {
                "mean_type": "overall",
                "mean_walking_time": 100.0,
                "mean_cycling_time": 20.0,
                "mean_non_travel": 2.0,
                "travel_cv": 1.0,
                "non_travel_cv": 1.0
            },
            "scenario": {
                "name": "double cycling",
                "mean_cycling_time": 40.0
            },
            "running": {
                "seed": 123,
                "sample_size": 5000,
                "quantiles": [0.2, 0.4, 0.6, 0.8],
                "exponent": 0.25
            },
            "output": {
                "folder": "results",
                "file_name": "ITHIM_{TIMESTAMP}.json"
            }
        })");
}

class ConfigurationFixture : public ::testing::Test {
  protected:
    void SetUp() override {
        dir_.write_file("active_transport.csv", ACTIVE_TRANSPORT);
        dir_.write_file("population_share.csv", POPULATION_SHARE);
        dir_.write_file("gbd.csv", create_burden_csv());
    }

    std::filesystem::path write_config(const json &j) const {
        return dir_.write_file("config.json", j.dump(2));
    }

    const std::filesystem::path &tmp_path() const { return dir_.path(); }

  private:
    TempDir dir_;
};
} // namespace

TEST_F(ConfigurationFixture, LoadConfiguration) {
    auto config = get_configuration(write_config(create_config()), std::nullopt, false);

    ASSERT_EQ(tmp_path() / "active_transport.csv", config.inputs.active_transport);
    ASSERT_FALSE(config.inputs.non_travel_weights.has_value());
    ASSERT_EQ("overall", config.baseline.mean_type);
    ASSERT_DOUBLE_EQ(100.0, config.baseline.mean_walking_time);
    ASSERT_EQ("double cycling", config.scenario.name);
    ASSERT_DOUBLE_EQ(40.0, config.scenario.mean_cycling_time.value());
    ASSERT_FALSE(config.scenario.mean_walking_time.has_value());
    ASSERT_EQ(123u, config.running.seed.value());
    ASSERT_EQ(5000, config.running.sample_size);
    ASSERT_EQ("results", config.output.folder);
}

TEST_F(ConfigurationFixture, OutputFolderArgumentOverridesConfig) {
    auto config = get_configuration(write_config(create_config()), "other", true);

    ASSERT_EQ("other", config.output.folder);
    ASSERT_EQ(ithim::core::VerboseMode::verbose, config.verbosity);
}

TEST_F(ConfigurationFixture, CreateModelParameters) {
    auto config = get_configuration(write_config(create_config()), std::nullopt, false);

    auto options = create_model_options(config);
    ASSERT_EQ(5000, options.sample_size);
    ASSERT_EQ(123u, options.seed.value());
    ASSERT_DOUBLE_EQ(0.25, options.exponent);
    ASSERT_DOUBLE_EQ(4.5, options.walking_met);

    auto baseline = create_baseline_parameters(config);
    ASSERT_NO_THROW(baseline.validate());
    ASSERT_EQ(std::vector<int>({1, 2}), baseline.age_classes());
    ASSERT_EQ(ithim::MeanType::overall, baseline.mean_type);
    ASSERT_EQ(std::vector<double>({0.2, 0.4, 0.6, 0.8}), baseline.quantiles);
    ASSERT_DOUBLE_EQ(1.2, baseline.walking_weights.at(2, ithim::core::Gender::male));
    ASSERT_DOUBLE_EQ(4.0, baseline.non_travel_weights.sum());
    ASSERT_TRUE(baseline.burden.contains(ithim::DiseaseType::cvd));

    auto scenario = create_scenario_parameters(config, baseline);
    ASSERT_DOUBLE_EQ(40.0, scenario.mean_cycling_time);
    ASSERT_DOUBLE_EQ(100.0, scenario.mean_walking_time);
    ASSERT_EQ(baseline.walking_weights, scenario.walking_weights);
    ASSERT_DOUBLE_EQ(20.0, baseline.mean_cycling_time);
}

TEST_F(ConfigurationFixture, VersionMismatchThrows) {
    auto j = create_config();
    j["version"] = 2;
    ASSERT_THROW(get_configuration(write_config(j), std::nullopt, false),
                 ithim::core::ConfigurationError);

    j.erase("version");
    ASSERT_THROW(get_configuration(write_config(j), std::nullopt, false),
                 ithim::core::ConfigurationError);
}

TEST_F(ConfigurationFixture, InvalidSectionsThrow) {
    auto missing_input = create_config();
    missing_input["inputs"]["disease_burden"] = "missing.csv";
    ASSERT_THROW(get_configuration(write_config(missing_input), std::nullopt, false),
                 ithim::core::ConfigurationError);

    auto mean_type = create_config();
    mean_type["baseline"]["mean_type"] = "median";
    ASSERT_THROW(get_configuration(write_config(mean_type), std::nullopt, false),
                 ithim::core::ConfigurationError);

    auto wrong_type = create_config();
    wrong_type["baseline"]["mean_walking_time"] = "a lot";
    ASSERT_THROW(get_configuration(write_config(wrong_type), std::nullopt, false),
                 ithim::core::ConfigurationError);

    auto sample_size = create_config();
    sample_size["running"]["sample_size"] = 0;
    ASSERT_THROW(get_configuration(write_config(sample_size), std::nullopt, false),
                 ithim::core::ConfigurationError);

    ASSERT_THROW(get_configuration(tmp_path() / "missing.json", std::nullopt, false),
                 ithim::core::ConfigurationError);
}

TEST(TestInput_Configuration, GetMissingKeyThrows) {
    auto j = json{{"present", 1}};

    ASSERT_EQ(1, get(j, "present").get<int>());
    ASSERT_THROW(get(j, "absent"), ithim::core::ConfigurationError);

    int value = 0;
    ASSERT_TRUE(get_to(j, "present", value));
    ASSERT_FALSE(get_to(j, "absent", value));

    std::string text;
    auto success = true;
    ASSERT_FALSE(get_to(j, "present", text, success));
    ASSERT_FALSE(success);
}

TEST(TestInput_Configuration, RunningInfoDefaults) {
    auto info = json::parse(R"({"seed": null})").get<poco::RunningInfo>();

    ASSERT_FALSE(info.seed.has_value());
    ASSERT_EQ(100000, info.sample_size);
    ASSERT_EQ(std::vector<double>({0.1, 0.3, 0.5, 0.7, 0.9}), info.quantiles);
    ASSERT_FALSE(info.exponent.has_value());
}

TEST(TestInput_Configuration, CreateOutputFileName) {
    auto info = poco::OutputInfo{.folder = "results", .file_name = "ITHIM_{TIMESTAMP}.json"};
    auto file_name = std::filesystem::path{create_output_file_name(info)};

    ASSERT_EQ("results", file_name.parent_path().string());
    ASSERT_EQ(std::string::npos, file_name.string().find("{TIMESTAMP}"));
    ASSERT_EQ(".json", file_name.extension().string());

    info.file_name = "ITHIM_{UNKNOWN}.json";
    ASSERT_THROW(create_output_file_name(info), ithim::core::ConfigurationError);
}

TEST(TestInput_Configuration, ExpandEnvironmentVariables) {
#ifdef _WIN32
    _putenv_s("ITHIM_TEST_FOLDER", "expanded");
#else
    setenv("ITHIM_TEST_FOLDER", "expanded", 1);
#endif

    ASSERT_EQ("/tmp/expanded/out", expand_environment_variables("/tmp/${ITHIM_TEST_FOLDER}/out"));
    ASSERT_EQ("/tmp/plain", expand_environment_variables("/tmp/plain"));
}
