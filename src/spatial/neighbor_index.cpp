#include "gauge_adjust/spatial/neighbor_index.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <opencv2/flann.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace gauge_adjust::spatial {

namespace {

constexpr int kLeafMaxSize = 10;

using Distance = cvflann::L2<double>;
using KdTree = cvflann::Index<Distance>;

} // namespace

struct NeighborIndex::Impl {
    // FLANN keeps a view on this buffer, it must outlive the tree
    std::vector<double> points;
    int rows = 0;
    int dims = 0;
    std::unique_ptr<KdTree> tree;
};

NeighborIndex::NeighborIndex(const Coordinates& points)
    : impl_(std::make_unique<Impl>()) {
    if (points.rows() == 0 || points.cols() == 0) {
        throw InvalidInput("cannot build a neighbour index over an empty coordinate set");
    }
    if (!points.allFinite()) {
        throw InvalidInput("coordinate set contains non-finite values");
    }

    impl_->rows = static_cast<int>(points.rows());
    impl_->dims = static_cast<int>(points.cols());
    impl_->points.assign(points.data(), points.data() + points.size());

    cvflann::Matrix<double> dataset(impl_->points.data(),
                                    static_cast<size_t>(impl_->rows),
                                    static_cast<size_t>(impl_->dims));
    impl_->tree = std::make_unique<KdTree>(dataset,
                                           cvflann::KDTreeSingleIndexParams(kLeafMaxSize));
    impl_->tree->buildIndex();
}

NeighborIndex::~NeighborIndex() = default;
NeighborIndex::NeighborIndex(NeighborIndex&& other) noexcept = default;
NeighborIndex& NeighborIndex::operator=(NeighborIndex&& other) noexcept = default;

int NeighborIndex::size() const { return impl_->rows; }

int NeighborIndex::dims() const { return impl_->dims; }

NeighborResult NeighborIndex::query_with_distances(const Coordinates& queries, int k) const {
    if (queries.rows() == 0) {
        throw InvalidInput("cannot query a neighbour index with an empty coordinate set");
    }
    if (queries.cols() != impl_->dims) {
        throw InvalidInput("query dimension " + std::to_string(queries.cols()) +
                           " does not match index dimension " + std::to_string(impl_->dims));
    }
    if (!queries.allFinite()) {
        throw InvalidInput("query coordinates contain non-finite values");
    }
    if (k < 1) {
        throw InvalidInput("number of neighbours must be >= 1, got " + std::to_string(k));
    }
    if (k > impl_->rows) {
        k = impl_->rows;
    }

    const size_t nq = static_cast<size_t>(queries.rows());
    std::vector<double> query_buf(queries.data(), queries.data() + queries.size());
    std::vector<int> index_buf(nq * static_cast<size_t>(k), -1);
    std::vector<double> dist_buf(nq * static_cast<size_t>(k), 0.0);

    cvflann::Matrix<double> q(query_buf.data(), nq, static_cast<size_t>(impl_->dims));
    cvflann::Matrix<int> indices(index_buf.data(), nq, static_cast<size_t>(k));
    cvflann::Matrix<double> dists(dist_buf.data(), nq, static_cast<size_t>(k));
    impl_->tree->knnSearch(q, indices, dists, k,
                           cvflann::SearchParams(cvflann::FLANN_CHECKS_UNLIMITED));

    NeighborResult out;
    out.indices.resize(static_cast<Eigen::Index>(nq), k);
    out.distances.resize(static_cast<Eigen::Index>(nq), k);
    for (size_t i = 0; i < nq; ++i) {
        for (int j = 0; j < k; ++j) {
            const size_t at = i * static_cast<size_t>(k) + static_cast<size_t>(j);
            out.indices(static_cast<Eigen::Index>(i), j) = index_buf[at];
            // L2 in FLANN is the squared distance
            out.distances(static_cast<Eigen::Index>(i), j) = std::sqrt(std::max(0.0, dist_buf[at]));
        }
    }
    return out;
}

IndexMatrix NeighborIndex::query(const Coordinates& queries, int k) const {
    return query_with_distances(queries, k).indices;
}

} // namespace gauge_adjust::spatial
