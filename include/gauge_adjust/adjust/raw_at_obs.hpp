#pragma once

#include "gauge_adjust/core/types.hpp"
#include "gauge_adjust/spatial/neighbor_index.hpp"

namespace gauge_adjust::adjust {

// Reduce the k neighbour values of every observation (one row per
// observation) to a single value. BEST needs the observation values.
VectorXd reduce_neighbors(NeighborStatistic stat,
                          const MatrixXd& neighbor_values,
                          const VectorXd* obs = nullptr);

// Per row, the neighbour value with the smallest absolute difference to obs
VectorXd best_match(const VectorXd& obs, const MatrixXd& neighbor_values);

// Raw field values "at" the observation locations, summarized over the k
// nearest raw points. Neighbour lookup happens once at construction.
class RawAtObservations {
public:
    RawAtObservations(const Coordinates& obs_coords, const Coordinates& raw_coords,
                      int k = 9, NeighborStatistic stat = NeighborStatistic::MEDIAN);
    RawAtObservations(const spatial::NeighborIndex& raw_index, const Coordinates& obs_coords,
                      int k = 9, NeighborStatistic stat = NeighborStatistic::MEDIAN);

    VectorXd evaluate(const VectorXd& raw, const VectorXd* obs = nullptr) const;
    VectorXd operator()(const VectorXd& raw, const VectorXd* obs = nullptr) const {
        return evaluate(raw, obs);
    }

    int neighbor_count() const { return static_cast<int>(raw_ix_.cols()); }

private:
    IndexMatrix raw_ix_;
    int num_raw_ = 0;
    NeighborStatistic stat_;
};

} // namespace gauge_adjust::adjust
