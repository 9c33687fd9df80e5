#include "gauge_adjust/interpolation/interpolator.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace gauge_adjust::interpolation {

namespace {

constexpr double kTiny = 1.0e-12;

double point_distance(const Coordinates& a, Eigen::Index i, const Coordinates& b, Eigen::Index j) {
    return (a.row(i) - b.row(j)).norm();
}

} // namespace

double rbf_kernel_multiquadric(double d, double mu) {
    return std::sqrt(d * d + mu * mu);
}

double rbf_kernel_thinplate(double d, double epsilon) {
    double d_safe = d + epsilon;
    return (d_safe > epsilon) ? (d_safe * d_safe * std::log(d_safe)) : 0.0;
}

double rbf_kernel_gaussian(double d, double mu) {
    return std::exp(-d * d / (2.0 * mu * mu));
}

double rbf_kernel(RbfKernel kernel, double d, double mu) {
    switch (kernel) {
        case RbfKernel::MULTIQUADRIC: return rbf_kernel_multiquadric(d, mu);
        case RbfKernel::THINPLATE: return rbf_kernel_thinplate(d, kTiny);
        case RbfKernel::GAUSSIAN: return rbf_kernel_gaussian(d, mu);
    }
    throw ConfigurationError("unsupported rbf kernel");
}

RbfInterpolator::RbfInterpolator(const Coordinates& src, const Coordinates& trg,
                                 RbfKernel kernel, double mu, double lambda)
    : num_sources_(static_cast<int>(src.rows())) {
    if (!(mu > 0.0)) {
        throw ConfigurationError("rbf mu must be > 0");
    }
    if (src.rows() > 0 && trg.rows() > 0 && src.cols() != trg.cols()) {
        throw InvalidInput("rbf source and target dimensions differ");
    }

    const Eigen::Index M = src.rows();
    psi_ = MatrixXd::Zero(trg.rows(), M);
    if (M == 0) return;

    // Build RBF matrix Phi (M x M) with ridge term
    MatrixXd phi(M, M);
    for (Eigen::Index i = 0; i < M; ++i) {
        for (Eigen::Index j = 0; j < M; ++j) {
            phi(i, j) = rbf_kernel(kernel, point_distance(src, i, src, j), mu);
        }
    }
    phi += std::max(0.0, lambda) * MatrixXd::Identity(M, M);
    solver_.compute(phi);

    for (Eigen::Index t = 0; t < trg.rows(); ++t) {
        for (Eigen::Index i = 0; i < M; ++i) {
            psi_(t, i) = rbf_kernel(kernel, point_distance(trg, t, src, i), mu);
        }
    }
}

VectorXd RbfInterpolator::evaluate(const VectorXd& src_values) const {
    check_source_count(src_values);
    if (num_sources_ == 0) {
        return VectorXd::Constant(psi_.rows(), kNoValue);
    }

    const VectorXd u = solver_.solve(src_values);
    if (!u.allFinite()) {
        std::cerr << "[RBF] Warning: kernel system not solvable, using mean of "
                  << num_sources_ << " sources" << std::endl;
        return VectorXd::Constant(psi_.rows(), src_values.mean());
    }
    return psi_ * u;
}

} // namespace gauge_adjust::interpolation
