#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace gauge_adjust::config {

namespace fs = std::filesystem;

struct MfbConfig {
  std::string method = "linregr"; // mean | median | linregr
  // Robustness gates for method=linregr
  double min_slope = 0.1;
  double min_correlation = 0.5;
  double max_p_value = 0.01;
};

struct AdjustConfig {
  std::string method = "additive"; // additive | multiplicative | mixed |
                                   // mfb | gauge_only | none
  int neighbor_count = 9;
  std::string neighbor_statistic = "median"; // mean | median | best
  // Below this many valid gauge/raw pairs the raw field is returned as is
  int min_gauges = 5;
  double min_value = 0.0;
  std::vector<double> invalid_values{-9999.0, -99.0};
  MfbConfig mfb;
};

struct InterpolatorConfig {
  std::string method = "idw"; // idw | nearest | rbf
  int nnear = 4;
  double power = 2.0;
  std::string rbf_kernel = "multiquadric"; // multiquadric | thinplate | gaussian
  double rbf_mu = 1.0;
  double rbf_lambda = 1.0e-9;
};

struct OutputConfig {
  bool pretty = false;
};

struct Config {
  AdjustConfig adjust;
  InterpolatorConfig interpolator;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace gauge_adjust::config
