#pragma once

#include "gauge_adjust/core/types.hpp"
#include "gauge_adjust/interpolation/interpolator.hpp"

#include <cstddef>
#include <memory>
#include <mutex>

namespace gauge_adjust::adjust {

struct InterpolatorCacheStats {
    int default_hits = 0;   // complete gauge set, default targets
    int memo_hits = 0;      // gauge subset seen on the previous call
    int memo_builds = 0;    // gauge subset changed, slot replaced
    int scoped_builds = 0;  // custom targets, never stored
};

// Hands out interpolators for (valid gauge subset, targets).
//
// The default instance (all gauges -> raw coordinates) is built once at
// construction. A gauge subset on the default targets is memoized in a
// single slot keyed by the index set; any other target set gets a fresh
// instance that is not stored. Instances are immutable, so callers keep
// using theirs even if the slot is replaced concurrently.
class InterpolatorCache {
public:
    using InterpolatorPtr = std::shared_ptr<const interpolation::Interpolator>;

    InterpolatorCache(std::shared_ptr<const Coordinates> obs_coords,
                      std::shared_ptr<const Coordinates> raw_coords,
                      interpolation::InterpolatorFactory factory);

    // targets == nullptr means the raw coordinates
    InterpolatorPtr get(const IndexSet& ix, const Coordinates* targets = nullptr) const;

    const InterpolatorPtr& default_instance() const { return default_; }
    bool is_default_targets(const Coordinates* targets) const;
    InterpolatorCacheStats stats() const;

private:
    struct SubsetKey {
        IndexSet ix;
        std::size_t hash = 0;

        bool operator==(const SubsetKey& other) const {
            return hash == other.hash && ix == other.ix;
        }
    };

    static std::size_t hash_indices(const IndexSet& ix);
    InterpolatorPtr build(const IndexSet& ix, const Coordinates& targets) const;

    std::shared_ptr<const Coordinates> obs_coords_;
    std::shared_ptr<const Coordinates> raw_coords_;
    interpolation::InterpolatorFactory factory_;
    InterpolatorPtr default_;

    mutable std::mutex mutex_;
    mutable bool has_memo_ = false;
    mutable SubsetKey memo_key_;
    mutable InterpolatorPtr memo_;
    mutable InterpolatorCacheStats stats_;
};

} // namespace gauge_adjust::adjust
