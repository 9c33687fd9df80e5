#include "gauge_adjust/interpolation/interpolator.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/spatial/neighbor_index.hpp"

#include <cmath>
#include <string>

namespace gauge_adjust::interpolation {

namespace {

// Targets closer than this to a source take the source value
constexpr double kCoincident = 1.0e-10;

} // namespace

void Interpolator::check_source_count(const VectorXd& src_values) const {
    if (src_values.size() != num_sources()) {
        throw ShapeMismatch("interpolator expects " + std::to_string(num_sources()) +
                            " source values, got " + std::to_string(src_values.size()));
    }
}

IdwInterpolator::IdwInterpolator(const Coordinates& src, const Coordinates& trg,
                                 int nnear, double power)
    : num_sources_(static_cast<int>(src.rows())),
      num_targets_(static_cast<int>(trg.rows())) {
    if (nnear < 1) {
        throw ConfigurationError("idw nnear must be >= 1");
    }
    if (num_sources_ == 0 || num_targets_ == 0) return;

    spatial::NeighborIndex tree(src);
    spatial::NeighborResult nn = tree.query_with_distances(trg, nnear);
    const Eigen::Index k = nn.indices.cols();

    ix_ = nn.indices;
    weights_ = MatrixXd::Zero(num_targets_, k);
    for (Eigen::Index i = 0; i < num_targets_; ++i) {
        if (k == 1 || nn.distances(i, 0) < kCoincident) {
            weights_(i, 0) = 1.0;
            continue;
        }
        double sum = 0.0;
        for (Eigen::Index j = 0; j < k; ++j) {
            const double w = 1.0 / std::pow(nn.distances(i, j), power);
            weights_(i, j) = w;
            sum += w;
        }
        weights_.row(i) /= sum;
    }
}

VectorXd IdwInterpolator::evaluate(const VectorXd& src_values) const {
    check_source_count(src_values);
    if (num_sources_ == 0) {
        return VectorXd::Constant(num_targets_, kNoValue);
    }

    VectorXd out(num_targets_);
    for (Eigen::Index i = 0; i < ix_.rows(); ++i) {
        double acc = 0.0;
        for (Eigen::Index j = 0; j < ix_.cols(); ++j) {
            const double w = weights_(i, j);
            if (w == 0.0) continue;
            acc += w * src_values(ix_(i, j));
        }
        out(i) = acc;
    }
    return out;
}

NearestInterpolator::NearestInterpolator(const Coordinates& src, const Coordinates& trg)
    : num_sources_(static_cast<int>(src.rows())) {
    if (num_sources_ == 0 || trg.rows() == 0) {
        ix_ = VectorXi::Constant(trg.rows(), -1);
        return;
    }
    spatial::NeighborIndex tree(src);
    ix_ = tree.query(trg, 1).col(0);
}

VectorXd NearestInterpolator::evaluate(const VectorXd& src_values) const {
    check_source_count(src_values);
    VectorXd out(ix_.size());
    for (Eigen::Index i = 0; i < ix_.size(); ++i) {
        out(i) = (ix_(i) < 0) ? kNoValue : src_values(ix_(i));
    }
    return out;
}

} // namespace gauge_adjust::interpolation
