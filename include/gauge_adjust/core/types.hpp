#pragma once

#include "gauge_adjust/core/errors.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>

namespace gauge_adjust {

// Point sets: one row per point, one column per dimension
using Coordinates = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;
using MatrixXd = Eigen::MatrixXd;
using IndexMatrix = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using IndexSet = std::vector<int>;

constexpr double kNoValue = std::numeric_limits<double>::quiet_NaN();

inline std::string normalize_name(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(norm.begin(), norm.end(), '-', '_');
    return norm;
}

// Statistic used to summarize the k raw neighbours of a gauge
enum class NeighborStatistic {
    MEAN,
    MEDIAN,
    BEST   // neighbour closest to the gauge value
};

inline std::string neighbor_statistic_to_string(NeighborStatistic stat) {
    switch (stat) {
        case NeighborStatistic::MEAN: return "mean";
        case NeighborStatistic::MEDIAN: return "median";
        case NeighborStatistic::BEST: return "best";
        default: return "unknown";
    }
}

inline NeighborStatistic neighbor_statistic_from_string(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "mean") return NeighborStatistic::MEAN;
    if (norm == "median") return NeighborStatistic::MEDIAN;
    if (norm == "best") return NeighborStatistic::BEST;
    throw ConfigurationError("unknown neighbor statistic '" + s +
                             "' (expected mean, median or best)");
}

// Error model used to relate gauge and raw values
enum class ErrorModelKind {
    ADDITIVE,
    MULTIPLICATIVE,
    MIXED,
    MEAN_FIELD_BIAS,
    GAUGE_ONLY,
    NONE
};

inline std::string error_model_to_string(ErrorModelKind kind) {
    switch (kind) {
        case ErrorModelKind::ADDITIVE: return "additive";
        case ErrorModelKind::MULTIPLICATIVE: return "multiplicative";
        case ErrorModelKind::MIXED: return "mixed";
        case ErrorModelKind::MEAN_FIELD_BIAS: return "mfb";
        case ErrorModelKind::GAUGE_ONLY: return "gauge_only";
        case ErrorModelKind::NONE: return "none";
        default: return "unknown";
    }
}

inline ErrorModelKind error_model_from_string(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "additive" || norm == "add") return ErrorModelKind::ADDITIVE;
    if (norm == "multiplicative" || norm == "multiply") return ErrorModelKind::MULTIPLICATIVE;
    if (norm == "mixed") return ErrorModelKind::MIXED;
    if (norm == "mfb" || norm == "mean_field_bias") return ErrorModelKind::MEAN_FIELD_BIAS;
    if (norm == "gauge_only" || norm == "gage_only") return ErrorModelKind::GAUGE_ONLY;
    if (norm == "none") return ErrorModelKind::NONE;
    throw ConfigurationError("unknown adjustment method '" + s + "'");
}

// How the mean field bias correction factor is derived
enum class MfbMethod {
    MEAN,
    MEDIAN,
    LINREGR
};

inline std::string mfb_method_to_string(MfbMethod m) {
    switch (m) {
        case MfbMethod::MEAN: return "mean";
        case MfbMethod::MEDIAN: return "median";
        case MfbMethod::LINREGR: return "linregr";
        default: return "unknown";
    }
}

inline MfbMethod mfb_method_from_string(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "mean") return MfbMethod::MEAN;
    if (norm == "median") return MfbMethod::MEDIAN;
    if (norm == "linregr") return MfbMethod::LINREGR;
    throw ConfigurationError("mfb.method has to be one out of 'mean', 'median' or 'linregr', got '" +
                             s + "'");
}

enum class InterpolatorMethod {
    IDW,
    NEAREST,
    RBF
};

inline std::string interpolator_method_to_string(InterpolatorMethod m) {
    switch (m) {
        case InterpolatorMethod::IDW: return "idw";
        case InterpolatorMethod::NEAREST: return "nearest";
        case InterpolatorMethod::RBF: return "rbf";
        default: return "unknown";
    }
}

inline InterpolatorMethod interpolator_method_from_string(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "idw") return InterpolatorMethod::IDW;
    if (norm == "nearest") return InterpolatorMethod::NEAREST;
    if (norm == "rbf") return InterpolatorMethod::RBF;
    throw ConfigurationError("unknown interpolator method '" + s + "'");
}

enum class RbfKernel {
    MULTIQUADRIC,
    THINPLATE,
    GAUSSIAN
};

inline std::string rbf_kernel_to_string(RbfKernel k) {
    switch (k) {
        case RbfKernel::MULTIQUADRIC: return "multiquadric";
        case RbfKernel::THINPLATE: return "thinplate";
        case RbfKernel::GAUSSIAN: return "gaussian";
        default: return "unknown";
    }
}

inline RbfKernel rbf_kernel_from_string(const std::string& s) {
    const std::string norm = normalize_name(s);
    if (norm == "multiquadric") return RbfKernel::MULTIQUADRIC;
    if (norm == "thinplate") return RbfKernel::THINPLATE;
    if (norm == "gaussian") return RbfKernel::GAUSSIAN;
    throw ConfigurationError("unknown rbf kernel '" + s + "'");
}

} // namespace gauge_adjust
