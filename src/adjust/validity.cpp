#include "gauge_adjust/adjust/validity.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace gauge_adjust::adjust {

bool is_valid_value(double v, double min_value, const std::vector<double>& invalid_values) {
    if (!std::isfinite(v)) return false;
    if (v < min_value) return false;
    for (double sentinel : invalid_values) {
        if (v == sentinel) return false;
    }
    return true;
}

IndexSet valid_indices(const VectorXd& values, double min_value,
                       const std::vector<double>& invalid_values) {
    IndexSet ix;
    ix.reserve(static_cast<size_t>(values.size()));
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (is_valid_value(values(i), min_value, invalid_values)) {
            ix.push_back(static_cast<int>(i));
        }
    }
    return ix;
}

IndexSet valid_pairs(const VectorXd& obs, const VectorXd& raw_at_obs, double min_value,
                     const std::vector<double>& invalid_values) {
    if (obs.size() != raw_at_obs.size()) {
        throw ShapeMismatch("observation vector has " + std::to_string(obs.size()) +
                            " values, raw at observations has " +
                            std::to_string(raw_at_obs.size()));
    }
    return intersect(valid_indices(obs, min_value, invalid_values),
                     valid_indices(raw_at_obs, min_value, invalid_values));
}

IndexSet intersect(const IndexSet& a, const IndexSet& b) {
    IndexSet out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

IndexSet set_difference(const IndexSet& a, const IndexSet& b) {
    IndexSet out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

} // namespace gauge_adjust::adjust
