#pragma once

#include "gauge_adjust/core/types.hpp"

#include <vector>

namespace gauge_adjust::adjust {

// Indices of usable observations together with the raw values at all
// observation locations. `ix` is sorted and unique.
struct ValidPairs {
    VectorXd raw_at_obs;
    IndexSet ix;
};

// A value is usable when finite, not a sentinel and not below min_value
bool is_valid_value(double v, double min_value, const std::vector<double>& invalid_values);

IndexSet valid_indices(const VectorXd& values, double min_value,
                       const std::vector<double>& invalid_values = {});

// Indices valid in both vectors
IndexSet valid_pairs(const VectorXd& obs, const VectorXd& raw_at_obs, double min_value,
                     const std::vector<double>& invalid_values = {});

// Set operations on sorted, unique index sets
IndexSet intersect(const IndexSet& a, const IndexSet& b);
IndexSet set_difference(const IndexSet& a, const IndexSet& b);

} // namespace gauge_adjust::adjust
