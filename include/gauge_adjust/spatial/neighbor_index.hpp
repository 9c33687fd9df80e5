#pragma once

#include "gauge_adjust/core/types.hpp"

#include <memory>

namespace gauge_adjust::spatial {

struct NeighborResult {
    IndexMatrix indices;   // [n_queries x k], nearest first
    MatrixXd distances;    // Euclidean distances matching `indices`
};

// Exact k-nearest-neighbour index over a fixed point set (single k-d tree).
// Built once; queries are read-only and may run concurrently.
class NeighborIndex {
public:
    explicit NeighborIndex(const Coordinates& points);
    ~NeighborIndex();

    NeighborIndex(NeighborIndex&& other) noexcept;
    NeighborIndex& operator=(NeighborIndex&& other) noexcept;
    NeighborIndex(const NeighborIndex&) = delete;
    NeighborIndex& operator=(const NeighborIndex&) = delete;

    int size() const;
    int dims() const;

    // k nearest point indices per query row. k is clamped to size().
    IndexMatrix query(const Coordinates& queries, int k) const;
    NeighborResult query_with_distances(const Coordinates& queries, int k) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gauge_adjust::spatial
