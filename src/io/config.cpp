#include "gauge_adjust/config/configuration.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/core/types.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace gauge_adjust::config {

// Reads node[key] into out when present; type errors name the full key path
template <typename T>
static void read_value(const YAML::Node& n, const std::string& section, const char* key, T& out) {
    const YAML::Node v = n[key];
    if (!v) return;
    try {
        out = v.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(section + "." + key + ": malformed value (" + e.what() + ")");
    }
}

static void read_double_list(const YAML::Node& n, const std::string& section, const char* key,
                             std::vector<double>& out) {
    const YAML::Node v = n[key];
    if (!v) return;
    if (!v.IsSequence()) {
        throw ConfigurationError(section + "." + key + " must be a list of numbers");
    }
    std::vector<double> values;
    for (size_t i = 0; i < v.size(); ++i) {
        try {
            values.push_back(v[i].as<double>());
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(section + "." + key + "[" + std::to_string(i) +
                                     "]: malformed value (" + e.what() + ")");
        }
    }
    out = std::move(values);
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["adjust"]) {
        auto a = node["adjust"];
        read_value(a, "adjust", "method", cfg.adjust.method);
        read_value(a, "adjust", "neighbor_count", cfg.adjust.neighbor_count);
        read_value(a, "adjust", "neighbor_statistic", cfg.adjust.neighbor_statistic);
        read_value(a, "adjust", "min_gauges", cfg.adjust.min_gauges);
        read_value(a, "adjust", "min_value", cfg.adjust.min_value);
        read_double_list(a, "adjust", "invalid_values", cfg.adjust.invalid_values);

        if (a["mfb"]) {
            auto m = a["mfb"];
            read_value(m, "adjust.mfb", "method", cfg.adjust.mfb.method);
            read_value(m, "adjust.mfb", "min_slope", cfg.adjust.mfb.min_slope);
            read_value(m, "adjust.mfb", "min_correlation", cfg.adjust.mfb.min_correlation);
            read_value(m, "adjust.mfb", "max_p_value", cfg.adjust.mfb.max_p_value);
        }
    }

    if (node["interpolator"]) {
        auto ip = node["interpolator"];
        read_value(ip, "interpolator", "method", cfg.interpolator.method);
        read_value(ip, "interpolator", "nnear", cfg.interpolator.nnear);
        read_value(ip, "interpolator", "power", cfg.interpolator.power);
        read_value(ip, "interpolator", "rbf_kernel", cfg.interpolator.rbf_kernel);
        read_value(ip, "interpolator", "rbf_mu", cfg.interpolator.rbf_mu);
        read_value(ip, "interpolator", "rbf_lambda", cfg.interpolator.rbf_lambda);
    }

    if (node["output"]) {
        read_value(node["output"], "output", "pretty", cfg.output.pretty);
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigurationError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["adjust"]["method"] = adjust.method;
    node["adjust"]["neighbor_count"] = adjust.neighbor_count;
    node["adjust"]["neighbor_statistic"] = adjust.neighbor_statistic;
    node["adjust"]["min_gauges"] = adjust.min_gauges;
    node["adjust"]["min_value"] = adjust.min_value;
    for (double v : adjust.invalid_values) {
        node["adjust"]["invalid_values"].push_back(v);
    }
    node["adjust"]["mfb"]["method"] = adjust.mfb.method;
    node["adjust"]["mfb"]["min_slope"] = adjust.mfb.min_slope;
    node["adjust"]["mfb"]["min_correlation"] = adjust.mfb.min_correlation;
    node["adjust"]["mfb"]["max_p_value"] = adjust.mfb.max_p_value;

    node["interpolator"]["method"] = interpolator.method;
    node["interpolator"]["nnear"] = interpolator.nnear;
    node["interpolator"]["power"] = interpolator.power;
    node["interpolator"]["rbf_kernel"] = interpolator.rbf_kernel;
    node["interpolator"]["rbf_mu"] = interpolator.rbf_mu;
    node["interpolator"]["rbf_lambda"] = interpolator.rbf_lambda;

    node["output"]["pretty"] = output.pretty;

    return node;
}

void Config::validate() const {
    // Name lookups throw ConfigurationError on unknown values
    error_model_from_string(adjust.method);
    neighbor_statistic_from_string(adjust.neighbor_statistic);
    mfb_method_from_string(adjust.mfb.method);
    interpolator_method_from_string(interpolator.method);
    rbf_kernel_from_string(interpolator.rbf_kernel);

    if (adjust.neighbor_count < 1) {
        throw ConfigurationError("adjust.neighbor_count must be >= 1");
    }
    if (adjust.min_gauges < 0) {
        throw ConfigurationError("adjust.min_gauges must be >= 0");
    }
    if (std::isnan(adjust.min_value)) {
        throw ConfigurationError("adjust.min_value must not be NaN");
    }
    for (double v : adjust.invalid_values) {
        if (std::isnan(v)) {
            throw ConfigurationError("adjust.invalid_values must not contain NaN");
        }
    }
    if (!std::isfinite(adjust.mfb.min_slope)) {
        throw ConfigurationError("adjust.mfb.min_slope must be finite");
    }
    if (adjust.mfb.min_correlation < -1.0 || adjust.mfb.min_correlation > 1.0) {
        throw ConfigurationError("adjust.mfb.min_correlation must be in [-1,1]");
    }
    if (adjust.mfb.max_p_value < 0.0 || adjust.mfb.max_p_value > 1.0) {
        throw ConfigurationError("adjust.mfb.max_p_value must be in [0,1]");
    }

    if (interpolator.nnear < 1) {
        throw ConfigurationError("interpolator.nnear must be >= 1");
    }
    if (!(interpolator.power >= 0.0) || !std::isfinite(interpolator.power)) {
        throw ConfigurationError("interpolator.power must be finite and >= 0");
    }
    if (!(interpolator.rbf_mu > 0.0) || !std::isfinite(interpolator.rbf_mu)) {
        throw ConfigurationError("interpolator.rbf_mu must be > 0");
    }
    if (!(interpolator.rbf_lambda >= 0.0) || !std::isfinite(interpolator.rbf_lambda)) {
        throw ConfigurationError("interpolator.rbf_lambda must be >= 0");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "adjust": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["additive", "multiplicative", "mixed", "mfb", "gauge_only", "none"]},
        "neighbor_count": {"type": "integer", "minimum": 1},
        "neighbor_statistic": {"type": "string", "enum": ["mean", "median", "best"]},
        "min_gauges": {"type": "integer", "minimum": 0},
        "min_value": {"type": "number"},
        "invalid_values": {"type": "array", "items": {"type": "number"}},
        "mfb": {
          "type": "object",
          "properties": {
            "method": {"type": "string", "enum": ["mean", "median", "linregr"]},
            "min_slope": {"type": "number"},
            "min_correlation": {"type": "number", "minimum": -1, "maximum": 1},
            "max_p_value": {"type": "number", "minimum": 0, "maximum": 1}
          }
        }
      }
    },
    "interpolator": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["idw", "nearest", "rbf"]},
        "nnear": {"type": "integer", "minimum": 1},
        "power": {"type": "number", "minimum": 0},
        "rbf_kernel": {"type": "string", "enum": ["multiquadric", "thinplate", "gaussian"]},
        "rbf_mu": {"type": "number", "exclusiveMinimum": 0},
        "rbf_lambda": {"type": "number", "minimum": 0}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "pretty": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace gauge_adjust::config
