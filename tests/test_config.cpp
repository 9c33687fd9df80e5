#include "gauge_adjust/config/configuration.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <filesystem>
#include <fstream>

using gauge_adjust::ConfigurationError;
using gauge_adjust::config::Config;

namespace fs = std::filesystem;

TEST_CASE("config_defaults_are_valid") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.adjust.method == "additive");
  REQUIRE(cfg.adjust.neighbor_count == 9);
  REQUIRE(cfg.adjust.neighbor_statistic == "median");
  REQUIRE(cfg.adjust.min_gauges == 5);
  REQUIRE(cfg.adjust.min_value == 0.0);
  REQUIRE(cfg.adjust.invalid_values == (std::vector<double>{-9999.0, -99.0}));
  REQUIRE(cfg.adjust.mfb.method == "linregr");
  REQUIRE(cfg.adjust.mfb.min_slope == Catch::Approx(0.1));
  REQUIRE(cfg.adjust.mfb.min_correlation == Catch::Approx(0.5));
  REQUIRE(cfg.adjust.mfb.max_p_value == Catch::Approx(0.01));
  REQUIRE(cfg.interpolator.method == "idw");
  REQUIRE(cfg.interpolator.nnear == 4);
}

TEST_CASE("config_from_yaml_overrides_given_keys") {
  YAML::Node node = YAML::Load(R"(
adjust:
  method: mixed
  neighbor_count: 3
  neighbor_statistic: best
  invalid_values: [-1.0]
  mfb:
    method: median
    max_p_value: 0.05
interpolator:
  method: rbf
  rbf_kernel: gaussian
  rbf_mu: 2.5
output:
  pretty: true
)");
  Config cfg = Config::from_yaml(node);
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.adjust.method == "mixed");
  REQUIRE(cfg.adjust.neighbor_count == 3);
  REQUIRE(cfg.adjust.neighbor_statistic == "best");
  REQUIRE(cfg.adjust.min_gauges == 5);
  REQUIRE(cfg.adjust.invalid_values == (std::vector<double>{-1.0}));
  REQUIRE(cfg.adjust.mfb.method == "median");
  REQUIRE(cfg.adjust.mfb.max_p_value == Catch::Approx(0.05));
  REQUIRE(cfg.adjust.mfb.min_slope == Catch::Approx(0.1));
  REQUIRE(cfg.interpolator.method == "rbf");
  REQUIRE(cfg.interpolator.rbf_kernel == "gaussian");
  REQUIRE(cfg.interpolator.rbf_mu == Catch::Approx(2.5));
  REQUIRE(cfg.output.pretty);
}

TEST_CASE("config_yaml_round_trip") {
  Config cfg;
  cfg.adjust.method = "mfb";
  cfg.adjust.min_gauges = 3;
  cfg.adjust.min_value = -1.0;
  cfg.adjust.mfb.min_correlation = 0.7;
  cfg.interpolator.nnear = 6;
  cfg.interpolator.power = 1.5;

  Config back = Config::from_yaml(YAML::Load(YAML::Dump(cfg.to_yaml())));
  REQUIRE(back.adjust.method == "mfb");
  REQUIRE(back.adjust.min_gauges == 3);
  REQUIRE(back.adjust.min_value == Catch::Approx(-1.0));
  REQUIRE(back.adjust.invalid_values == cfg.adjust.invalid_values);
  REQUIRE(back.adjust.mfb.min_correlation == Catch::Approx(0.7));
  REQUIRE(back.interpolator.nnear == 6);
  REQUIRE(back.interpolator.power == Catch::Approx(1.5));
}

TEST_CASE("config_save_and_load_file") {
  const fs::path path = fs::temp_directory_path() / "gauge_adjust_test_config.yaml";
  Config cfg;
  cfg.adjust.neighbor_statistic = "mean";
  cfg.save(path);

  Config loaded = Config::load(path);
  REQUIRE(loaded.adjust.neighbor_statistic == "mean");
  fs::remove(path);
}

TEST_CASE("config_load_missing_file_fails") {
  REQUIRE_THROWS_AS(Config::load("/nonexistent/gauge_adjust.yaml"), ConfigurationError);
}

TEST_CASE("config_malformed_value_fails") {
  YAML::Node node = YAML::Load("adjust:\n  neighbor_count: many\n");
  REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigurationError);
}

TEST_CASE("config_malformed_value_names_its_key") {
  using Catch::Matchers::ContainsSubstring;

  YAML::Node count = YAML::Load("adjust:\n  neighbor_count: many\n");
  REQUIRE_THROWS_WITH(Config::from_yaml(count), ContainsSubstring("adjust.neighbor_count"));

  YAML::Node slope = YAML::Load("adjust:\n  mfb:\n    min_slope: steep\n");
  REQUIRE_THROWS_WITH(Config::from_yaml(slope), ContainsSubstring("adjust.mfb.min_slope"));

  YAML::Node pretty = YAML::Load("output:\n  pretty: maybe\n");
  REQUIRE_THROWS_WITH(Config::from_yaml(pretty), ContainsSubstring("output.pretty"));

  YAML::Node entry = YAML::Load("adjust:\n  invalid_values: [-9999.0, none]\n");
  REQUIRE_THROWS_WITH(Config::from_yaml(entry), ContainsSubstring("adjust.invalid_values[1]"));
}

TEST_CASE("config_scalar_invalid_values_fails") {
  YAML::Node node = YAML::Load("adjust:\n  invalid_values: -999\n");
  REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigurationError);
}

TEST_CASE("config_validate_rejects_bad_values") {
  {
    Config cfg;
    cfg.adjust.method = "kriging";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.adjust.neighbor_statistic = "mode";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.adjust.mfb.method = "regression";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.adjust.neighbor_count = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.adjust.min_gauges = -1;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.adjust.mfb.max_p_value = 2.0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.adjust.invalid_values.push_back(std::nan(""));
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.interpolator.rbf_mu = 0.0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
  {
    Config cfg;
    cfg.interpolator.power = -1.0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  }
}

TEST_CASE("config_schema_is_json") {
  auto schema = nlohmann::json::parse(gauge_adjust::config::get_schema_json());
  REQUIRE(schema["type"] == "object");
  REQUIRE(schema["properties"].contains("adjust"));
  REQUIRE(schema["properties"].contains("interpolator"));
  REQUIRE(schema["properties"]["adjust"]["properties"]["method"]["enum"].size() == 6);
}
