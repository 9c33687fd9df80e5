#include "gauge_adjust/adjust/adjuster.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace gauge_adjust::adjust {

namespace {

config::Config validated(const config::Config& cfg) {
    cfg.validate();
    return cfg;
}

std::shared_ptr<const Coordinates> share_coordinates(const Coordinates& coords,
                                                     const std::string& what) {
    if (coords.rows() == 0 || coords.cols() == 0) {
        throw InvalidInput(what + " coordinate set is empty");
    }
    if (!coords.allFinite()) {
        throw InvalidInput(what + " coordinates contain non-finite values");
    }
    return std::make_shared<const Coordinates>(coords);
}

MfbSettings mfb_settings(const config::MfbConfig& cfg) {
    MfbSettings s;
    s.method = mfb_method_from_string(cfg.method);
    s.min_slope = cfg.min_slope;
    s.min_correlation = cfg.min_correlation;
    s.max_p_value = cfg.max_p_value;
    return s;
}

} // namespace

Adjuster::Adjuster(const Coordinates& obs_coords, const Coordinates& raw_coords,
                   ErrorModelKind kind, const config::Config& cfg,
                   interpolation::InterpolatorFactory factory)
    : config_(validated(cfg)),
      obs_coords_(share_coordinates(obs_coords, "observation")),
      raw_coords_(share_coordinates(raw_coords, "raw")),
      model_(create_error_model(kind, mfb_settings(config_.adjust.mfb))),
      raw_index_(*raw_coords_),
      raw_at_obs_(raw_index_, *obs_coords_, config_.adjust.neighbor_count,
                  neighbor_statistic_from_string(config_.adjust.neighbor_statistic)),
      raw_direct_(raw_index_, *obs_coords_, 1, NeighborStatistic::MEDIAN) {
    if (obs_coords_->cols() != raw_coords_->cols()) {
        throw InvalidInput("observation coordinates have " + std::to_string(obs_coords_->cols()) +
                           " dimensions, raw coordinates " + std::to_string(raw_coords_->cols()));
    }
    config_.adjust.method = error_model_to_string(kind);

    if (model_->needs_interpolator()) {
        if (!factory) {
            factory = interpolation::make_interpolator_factory(config_.interpolator);
        }
        cache_ = std::make_unique<InterpolatorCache>(obs_coords_, raw_coords_, std::move(factory));
    }
}

Adjuster::Adjuster(const Coordinates& obs_coords, const Coordinates& raw_coords,
                   const config::Config& cfg, interpolation::InterpolatorFactory factory)
    : Adjuster(obs_coords, raw_coords, error_model_from_string(cfg.adjust.method), cfg,
               std::move(factory)) {}

void Adjuster::check_obs(const VectorXd& obs) const {
    if (obs.size() != obs_coords_->rows()) {
        throw ShapeMismatch("got " + std::to_string(obs.size()) + " observations for " +
                            std::to_string(obs_coords_->rows()) + " observation coordinates");
    }
}

void Adjuster::check_raw(const VectorXd& raw) const {
    if (raw.size() != raw_coords_->rows()) {
        throw ShapeMismatch("got " + std::to_string(raw.size()) + " raw values for " +
                            std::to_string(raw_coords_->rows()) + " raw coordinates");
    }
}

void Adjuster::check_targets(const Coordinates& targets) const {
    if (targets.rows() == 0) {
        throw InvalidInput("target coordinate set is empty");
    }
    if (targets.cols() != raw_coords_->cols()) {
        throw InvalidInput("target coordinates have " + std::to_string(targets.cols()) +
                           " dimensions, expected " + std::to_string(raw_coords_->cols()));
    }
    if (!targets.allFinite()) {
        throw InvalidInput("target coordinates contain non-finite values");
    }
}

ValidPairs Adjuster::valid_pairs(const VectorXd& obs, const VectorXd& raw) const {
    check_obs(obs);
    check_raw(raw);

    ValidPairs pairs;
    pairs.raw_at_obs = raw_at_obs_.evaluate(raw, &obs);
    pairs.ix = adjust::valid_pairs(obs, pairs.raw_at_obs, config_.adjust.min_value,
                                   config_.adjust.invalid_values);
    return pairs;
}

VectorXd Adjuster::apply(const VectorXd& obs, const VectorXd& raw) const {
    const ValidPairs pairs = valid_pairs(obs, raw);
    return run(obs, raw, pairs, nullptr);
}

VectorXd Adjuster::apply(const VectorXd& obs, const VectorXd& raw,
                         const Coordinates& targets) const {
    check_targets(targets);
    const ValidPairs pairs = valid_pairs(obs, raw);

    const IndexMatrix nearest = raw_index_.query(targets, 1);
    VectorXd raw_at_targets(targets.rows());
    for (Eigen::Index i = 0; i < targets.rows(); ++i) {
        raw_at_targets(i) = raw(nearest(i, 0));
    }
    return run(obs, raw_at_targets, pairs, &targets);
}

VectorXd Adjuster::apply(const VectorXd& obs, const VectorXd& raw_at_targets,
                         const Coordinates& targets, const ValidPairs& pairs) const {
    check_obs(obs);
    check_targets(targets);
    if (raw_at_targets.size() != targets.rows()) {
        throw ShapeMismatch("got " + std::to_string(raw_at_targets.size()) + " raw values for " +
                            std::to_string(targets.rows()) + " targets");
    }
    if (pairs.raw_at_obs.size() != obs.size()) {
        throw ShapeMismatch("raw at observations has " + std::to_string(pairs.raw_at_obs.size()) +
                            " values, expected " + std::to_string(obs.size()));
    }
    int prev = -1;
    for (int i : pairs.ix) {
        if (i < 0 || i >= obs.size()) {
            throw InvalidInput("valid pair index " + std::to_string(i) + " out of range");
        }
        if (i <= prev) {
            throw InvalidInput("valid pair indices must be strictly increasing, got " +
                               std::to_string(i) + " after " + std::to_string(prev));
        }
        prev = i;
    }
    return run(obs, raw_at_targets, pairs, &targets);
}

VectorXd Adjuster::run(const VectorXd& obs, const VectorXd& raw_at_targets,
                       const ValidPairs& pairs, const Coordinates* targets) const {
    const int min_gauges = config_.adjust.min_gauges;
    if (static_cast<int>(pairs.ix.size()) < min_gauges) {
        std::cerr << "[ADJ] Only " << pairs.ix.size() << " valid gauges (min " << min_gauges
                  << "), " << model_->name() << " returns raw values" << std::endl;
        return raw_at_targets;
    }

    InterpolatorCache::InterpolatorPtr ip;
    if (cache_) {
        ip = cache_->get(pairs.ix, targets);
    }

    const ErrorModelContext ctx{obs, raw_at_targets, pairs.raw_at_obs, pairs.ix, ip.get(),
                                min_gauges};
    return model_->correct(ctx);
}

InterpolatorCacheStats Adjuster::cache_stats() const {
    return cache_ ? cache_->stats() : InterpolatorCacheStats{};
}

} // namespace gauge_adjust::adjust
