#include "gauge_adjust/adjust/adjuster.hpp"

#include <iostream>

namespace gauge_adjust::adjust {

CrossValidationResult Adjuster::xvalidate(const VectorXd& obs, const VectorXd& raw) const {
    const ValidPairs pairs = valid_pairs(obs, raw);

    // Gauges also need a usable raw value right at their location
    const VectorXd raw_direct = raw_direct_.evaluate(raw);
    const IndexSet ix = intersect(
        pairs.ix,
        valid_indices(raw_direct, config_.adjust.min_value, config_.adjust.invalid_values));

    CrossValidationResult result;
    result.observed = obs;
    result.estimated = VectorXd::Constant(obs.size(), kNoValue);

    if (static_cast<int>(ix.size()) < config_.adjust.min_gauges) {
        std::cerr << "[XVAL] Only " << ix.size() << " usable gauges (min "
                  << config_.adjust.min_gauges << "), no estimates" << std::endl;
        return result;
    }

    ValidPairs held_out;
    held_out.raw_at_obs = pairs.raw_at_obs;
    VectorXd raw_at_target(1);
    for (int i : ix) {
        held_out.ix = set_difference(ix, IndexSet{i});
        raw_at_target(0) = raw_direct(i);
        const Coordinates target = obs_coords_->row(i);
        result.estimated(i) = apply(obs, raw_at_target, target, held_out)(0);
    }

    std::cerr << "[XVAL] Estimated " << ix.size() << "/" << obs.size() << " gauges" << std::endl;
    return result;
}

} // namespace gauge_adjust::adjust
