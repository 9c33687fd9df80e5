#include "gauge_adjust/adjust/adjuster.hpp"
#include "gauge_adjust/config/configuration.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/core/events.hpp"
#include "gauge_adjust/core/types.hpp"
#include "gauge_adjust/core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace gauge_adjust;

namespace {

struct InputData {
    Coordinates obs_coords;
    VectorXd obs;
    Coordinates raw_coords;
    VectorXd raw;
};

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

double json_to_double(const json& v, const std::string& key) {
    if (v.is_null()) return kNoValue;
    if (!v.is_number()) {
        throw InvalidInput("'" + key + "' must contain numbers or null");
    }
    return v.get<double>();
}

VectorXd parse_values(const json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_array()) {
        throw InvalidInput("input is missing array '" + key + "'");
    }
    const json& arr = j[key];
    VectorXd out(static_cast<Eigen::Index>(arr.size()));
    for (size_t i = 0; i < arr.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = json_to_double(arr[i], key);
    }
    return out;
}

Coordinates parse_coordinates(const json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_array()) {
        throw InvalidInput("input is missing array '" + key + "'");
    }
    const json& arr = j[key];
    if (arr.empty()) {
        return Coordinates(0, 0);
    }
    if (!arr[0].is_array() || arr[0].empty()) {
        throw InvalidInput("'" + key + "' must be a list of coordinate tuples");
    }

    const size_t dims = arr[0].size();
    Coordinates out(static_cast<Eigen::Index>(arr.size()), static_cast<Eigen::Index>(dims));
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_array() || arr[i].size() != dims) {
            throw InvalidInput("'" + key + "' row " + std::to_string(i) + " does not have " +
                               std::to_string(dims) + " coordinates");
        }
        for (size_t d = 0; d < dims; ++d) {
            out(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(d)) =
                json_to_double(arr[i][d], key);
        }
    }
    return out;
}

InputData load_input(const std::string& path) {
    const std::string text = (path == "-") ? read_stdin() : core::read_text(path);

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IOError("cannot parse " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw InvalidInput("input must be a JSON object");
    }

    InputData in;
    in.obs_coords = parse_coordinates(j, "obs_coords");
    in.obs = parse_values(j, "obs");
    in.raw_coords = parse_coordinates(j, "raw_coords");
    in.raw = parse_values(j, "raw");
    return in;
}

// NaN and infinities are written as null
json values_to_json(const VectorXd& v) {
    json arr = json::array();
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (std::isfinite(v(i))) {
            arr.push_back(v(i));
        } else {
            arr.push_back(nullptr);
        }
    }
    return arr;
}

json cache_stats_to_json(const adjust::InterpolatorCacheStats& s) {
    return {{"default_hits", s.default_hits},
            {"memo_hits", s.memo_hits},
            {"memo_builds", s.memo_builds},
            {"scoped_builds", s.scoped_builds}};
}

void write_result(const json& result, const std::string& output, bool pretty) {
    const std::string text = pretty ? result.dump(2) : result.dump();
    if (output.empty() || output == "-") {
        std::cout << text << std::endl;
    } else {
        core::write_text(output, text + "\n");
    }
}

int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

int cmd_validate_config(const std::string& path) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const GaugeAdjustError& e) {
        result["errors"].push_back(e.what());
    }

    std::cout << result.dump(2) << std::endl;
    return result["valid"].get<bool>() ? 0 : 2;
}

int cmd_run(const std::string& command, const std::string& config_path,
            const std::string& input_path, const std::string& output_path) {
    core::EventEmitter events;
    const std::string run_id = core::get_run_id();

    events.run_start(run_id,
                     {{"command", command}, {"config", config_path}, {"input", input_path}},
                     std::cerr);

    try {
        events.step_start(run_id, "load", std::cerr);
        const config::Config cfg = config::Config::load(config_path);
        cfg.validate();
        const InputData in = load_input(input_path);
        events.step_end(run_id, "load", "ok",
                        {{"n_obs", in.obs.size()}, {"n_raw", in.raw.size()},
                         {"dims", in.raw_coords.cols()}},
                        std::cerr);

        events.step_start(run_id, "prepare", std::cerr);
        adjust::Adjuster adjuster(in.obs_coords, in.raw_coords, cfg);
        events.step_end(run_id, "prepare", "ok",
                        {{"method", adjuster.model().name()}}, std::cerr);

        json result;
        result["method"] = adjuster.model().name();

        if (command == "adjust") {
            events.step_start(run_id, "adjust", std::cerr);
            const adjust::ValidPairs pairs = adjuster.valid_pairs(in.obs, in.raw);
            const VectorXd adjusted = adjuster.apply(in.obs, in.raw);

            result["n_valid_pairs"] = pairs.ix.size();
            result["adjusted"] = values_to_json(adjusted);

            if (const auto* mfb = dynamic_cast<const adjust::MeanFieldBiasModel*>(&adjuster.model())) {
                const adjust::MeanFieldBiasEstimate est = mfb->estimate(
                    in.obs, pairs.raw_at_obs, pairs.ix, cfg.adjust.min_gauges);
                json m;
                m["corrfact"] = est.corrfact;
                m["num_ratios"] = est.num_ratios;
                m["sufficient"] = est.sufficient;
                m["accepted"] = est.accepted;
                if (est.regression) {
                    m["slope"] = est.regression->slope;
                    m["intercept"] = est.regression->intercept;
                    m["r"] = est.regression->r;
                    m["p_value"] = est.regression->p_value;
                    m["std_err"] = est.regression->std_err;
                }
                result["mfb"] = m;
            }
            if (pairs.ix.size() < static_cast<size_t>(cfg.adjust.min_gauges)) {
                events.warning(run_id, "not enough valid gauges, raw field returned", std::cerr);
            }
            events.step_end(run_id, "adjust", "ok",
                            {{"n_valid_pairs", pairs.ix.size()}}, std::cerr);
        } else {
            events.step_start(run_id, "xvalidate", std::cerr);
            const adjust::CrossValidationResult xv = adjuster.xvalidate(in.obs, in.raw);

            int n_estimated = 0;
            for (Eigen::Index i = 0; i < xv.estimated.size(); ++i) {
                if (std::isfinite(xv.estimated(i))) ++n_estimated;
            }
            result["observed"] = values_to_json(xv.observed);
            result["estimated"] = values_to_json(xv.estimated);
            result["n_estimated"] = n_estimated;
            if (n_estimated == 0) {
                events.warning(run_id, "no cross-validation estimates", std::cerr);
            }
            events.step_end(run_id, "xvalidate", "ok", {{"n_estimated", n_estimated}}, std::cerr);
        }

        result["cache"] = cache_stats_to_json(adjuster.cache_stats());
        write_result(result, output_path, cfg.output.pretty);
    } catch (const GaugeAdjustError& e) {
        events.error(run_id, e.what(), std::cerr);
        events.run_end(run_id, false, "error", std::cerr);
        return 2;
    }

    events.run_end(run_id, true, "ok", std::cerr);
    return 0;
}

void print_usage() {
    std::cout << "Usage: gauge_adjust_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  adjust --config C --input I [--output O]     Adjust the raw field by the gauges\n"
              << "  xvalidate --config C --input I [--output O]  Leave-one-out cross-validation\n"
              << "  validate-config --path P                     Validate a config YAML file\n"
              << "  schema                                       Print JSON schema for config\n"
              << "\nInput is a JSON object with obs_coords, obs, raw_coords and raw;\n"
              << "'-' reads it from stdin. Results go to stdout unless --output is given.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    if (command == "schema" || command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path\n";
            return 1;
        }
        return cmd_validate_config(path);
    }

    if (command == "adjust" || command == "xvalidate") {
        std::string config_path = get_arg("--config", "-c");
        std::string input_path = get_arg("--input", "-i");
        if (config_path.empty() || input_path.empty()) {
            std::cerr << command << " requires --config and --input\n";
            return 1;
        }
        return cmd_run(command, config_path, input_path, get_arg("--output", "-o"));
    }

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
