#pragma once

#include "gauge_adjust/adjust/error_models.hpp"
#include "gauge_adjust/adjust/interpolator_cache.hpp"
#include "gauge_adjust/adjust/raw_at_obs.hpp"
#include "gauge_adjust/adjust/validity.hpp"
#include "gauge_adjust/config/configuration.hpp"
#include "gauge_adjust/core/types.hpp"
#include "gauge_adjust/spatial/neighbor_index.hpp"

#include <memory>

namespace gauge_adjust::adjust {

struct CrossValidationResult {
    VectorXd observed;   // the observations as passed in
    VectorXd estimated;  // leave-one-out estimate, NaN where not computed
};

// Gauge adjustment engine.
//
// Coordinates of the gauges and of the raw field are fixed at construction,
// together with the error model and all neighbour lookups. Each call takes
// fresh gauge and raw values, finds the usable gauge/raw pairs, lets the
// error model derive an error from them and spreads it onto the targets.
// Below `min_gauges` usable pairs the raw values are returned unchanged.
//
// All apply() overloads are const and safe to call concurrently.
class Adjuster {
public:
    // Error model given explicitly; config.adjust.method is ignored
    Adjuster(const Coordinates& obs_coords, const Coordinates& raw_coords,
             ErrorModelKind kind, const config::Config& cfg = {},
             interpolation::InterpolatorFactory factory = {});

    // Error model taken from config.adjust.method
    Adjuster(const Coordinates& obs_coords, const Coordinates& raw_coords,
             const config::Config& cfg, interpolation::InterpolatorFactory factory = {});

    // Corrected raw field
    VectorXd apply(const VectorXd& obs, const VectorXd& raw) const;
    VectorXd operator()(const VectorXd& obs, const VectorXd& raw) const { return apply(obs, raw); }

    // Corrected values at arbitrary targets. `raw` is the full raw field;
    // each target takes the raw value of its nearest raw coordinate.
    VectorXd apply(const VectorXd& obs, const VectorXd& raw, const Coordinates& targets) const;

    // Engine entry with precomputed pairs. `raw_at_targets` holds one raw
    // value per target row.
    VectorXd apply(const VectorXd& obs, const VectorXd& raw_at_targets,
                   const Coordinates& targets, const ValidPairs& pairs) const;

    ValidPairs valid_pairs(const VectorXd& obs, const VectorXd& raw) const;

    // Leave-one-out cross-validation over the usable gauges
    CrossValidationResult xvalidate(const VectorXd& obs, const VectorXd& raw) const;

    ErrorModelKind kind() const { return model_->kind(); }
    const ErrorModel& model() const { return *model_; }
    const config::Config& config() const { return config_; }
    int num_observations() const { return static_cast<int>(obs_coords_->rows()); }
    int num_raw() const { return static_cast<int>(raw_coords_->rows()); }
    InterpolatorCacheStats cache_stats() const;

private:
    VectorXd run(const VectorXd& obs, const VectorXd& raw_at_targets,
                 const ValidPairs& pairs, const Coordinates* targets) const;
    void check_obs(const VectorXd& obs) const;
    void check_raw(const VectorXd& raw) const;
    void check_targets(const Coordinates& targets) const;

    config::Config config_;
    std::shared_ptr<const Coordinates> obs_coords_;
    std::shared_ptr<const Coordinates> raw_coords_;
    std::unique_ptr<ErrorModel> model_;
    spatial::NeighborIndex raw_index_;
    RawAtObservations raw_at_obs_;
    RawAtObservations raw_direct_;  // k = 1, for cross-validation
    std::unique_ptr<InterpolatorCache> cache_;  // null for models without interpolation
};

} // namespace gauge_adjust::adjust
