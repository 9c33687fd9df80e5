#include "gauge_adjust/adjust/raw_at_obs.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/core/utils.hpp"

#include <cmath>
#include <string>

namespace gauge_adjust::adjust {

VectorXd best_match(const VectorXd& obs, const MatrixXd& neighbor_values) {
    if (obs.size() != neighbor_values.rows()) {
        throw ShapeMismatch("statistic 'best' needs one observation per neighbour row (" +
                            std::to_string(obs.size()) + " vs " +
                            std::to_string(neighbor_values.rows()) + ")");
    }

    VectorXd out(neighbor_values.rows());
    for (Eigen::Index i = 0; i < neighbor_values.rows(); ++i) {
        Eigen::Index best = 0;
        double best_diff = std::abs(obs(i) - neighbor_values(i, 0));
        for (Eigen::Index j = 1; j < neighbor_values.cols(); ++j) {
            const double diff = std::abs(obs(i) - neighbor_values(i, j));
            // first minimum wins; NaN differences never replace a finite one
            if (diff < best_diff || (std::isnan(best_diff) && !std::isnan(diff))) {
                best = j;
                best_diff = diff;
            }
        }
        out(i) = neighbor_values(i, best);
    }
    return out;
}

VectorXd reduce_neighbors(NeighborStatistic stat,
                          const MatrixXd& neighbor_values,
                          const VectorXd* obs) {
    if (neighbor_values.cols() == 1) {
        return neighbor_values.col(0);
    }

    switch (stat) {
        case NeighborStatistic::MEAN:
            return neighbor_values.rowwise().mean();
        case NeighborStatistic::MEDIAN: {
            VectorXd out(neighbor_values.rows());
            for (Eigen::Index i = 0; i < neighbor_values.rows(); ++i) {
                out(i) = core::compute_median(neighbor_values.row(i).transpose());
            }
            return out;
        }
        case NeighborStatistic::BEST:
            if (obs == nullptr) {
                throw ShapeMismatch("statistic 'best' requires observation values");
            }
            return best_match(*obs, neighbor_values);
    }
    throw ConfigurationError("unsupported neighbor statistic");
}

RawAtObservations::RawAtObservations(const Coordinates& obs_coords,
                                     const Coordinates& raw_coords,
                                     int k, NeighborStatistic stat)
    : RawAtObservations(spatial::NeighborIndex(raw_coords), obs_coords, k, stat) {}

RawAtObservations::RawAtObservations(const spatial::NeighborIndex& raw_index,
                                     const Coordinates& obs_coords,
                                     int k, NeighborStatistic stat)
    : raw_ix_(raw_index.query(obs_coords, k)),
      num_raw_(raw_index.size()),
      stat_(stat) {}

VectorXd RawAtObservations::evaluate(const VectorXd& raw, const VectorXd* obs) const {
    if (raw.size() != num_raw_) {
        throw ShapeMismatch("raw field has " + std::to_string(raw.size()) +
                            " values but " + std::to_string(num_raw_) +
                            " raw coordinates");
    }

    MatrixXd neighbor_values(raw_ix_.rows(), raw_ix_.cols());
    for (Eigen::Index i = 0; i < raw_ix_.rows(); ++i) {
        for (Eigen::Index j = 0; j < raw_ix_.cols(); ++j) {
            neighbor_values(i, j) = raw(raw_ix_(i, j));
        }
    }
    return reduce_neighbors(stat_, neighbor_values, obs);
}

} // namespace gauge_adjust::adjust
