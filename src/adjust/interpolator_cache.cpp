#include "gauge_adjust/adjust/interpolator_cache.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/core/utils.hpp"

#include <iostream>
#include <utility>

namespace gauge_adjust::adjust {

InterpolatorCache::InterpolatorCache(std::shared_ptr<const Coordinates> obs_coords,
                                     std::shared_ptr<const Coordinates> raw_coords,
                                     interpolation::InterpolatorFactory factory)
    : obs_coords_(std::move(obs_coords)),
      raw_coords_(std::move(raw_coords)),
      factory_(std::move(factory)) {
    if (!obs_coords_ || !raw_coords_) {
        throw InvalidInput("interpolator cache needs observation and raw coordinates");
    }
    if (!factory_) {
        throw ConfigurationError("no interpolator factory given");
    }
    default_ = InterpolatorPtr(factory_(*obs_coords_, *raw_coords_));
    if (!default_) {
        throw ConfigurationError("interpolator factory returned no instance");
    }
}

std::size_t InterpolatorCache::hash_indices(const IndexSet& ix) {
    // FNV-1a over the index values
    std::size_t h = 1469598103934665603ULL;
    for (int i : ix) {
        h ^= static_cast<std::size_t>(i);
        h *= 1099511628211ULL;
    }
    return h ^ ix.size();
}

bool InterpolatorCache::is_default_targets(const Coordinates* targets) const {
    return targets == nullptr || targets == raw_coords_.get() ||
           core::coordinates_equal(*targets, *raw_coords_);
}

InterpolatorCache::InterpolatorPtr InterpolatorCache::build(const IndexSet& ix,
                                                            const Coordinates& targets) const {
    InterpolatorPtr ip(factory_(core::select_rows(*obs_coords_, ix), targets));
    if (!ip) {
        throw ConfigurationError("interpolator factory returned no instance");
    }
    return ip;
}

InterpolatorCache::InterpolatorPtr InterpolatorCache::get(const IndexSet& ix,
                                                          const Coordinates* targets) const {
    const bool default_targets = is_default_targets(targets);

    if (!default_targets) {
        InterpolatorPtr scoped = build(ix, *targets);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.scoped_builds;
        return scoped;
    }

    if (static_cast<Eigen::Index>(ix.size()) == obs_coords_->rows()) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.default_hits;
        return default_;
    }

    SubsetKey key{ix, hash_indices(ix)};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (has_memo_ && memo_key_ == key) {
            ++stats_.memo_hits;
            return memo_;
        }
    }

    // Build outside the lock; a concurrent builder for the same key only
    // costs a duplicate construction
    InterpolatorPtr fresh = build(ix, *raw_coords_);
    std::cerr << "[IPCACHE] Rebuilt interpolator for " << ix.size() << "/"
              << obs_coords_->rows() << " valid gauges" << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    memo_key_ = std::move(key);
    memo_ = fresh;
    has_memo_ = true;
    ++stats_.memo_builds;
    return fresh;
}

InterpolatorCacheStats InterpolatorCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace gauge_adjust::adjust
