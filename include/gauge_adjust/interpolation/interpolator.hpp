#pragma once

#include "gauge_adjust/config/configuration.hpp"
#include "gauge_adjust/core/types.hpp"

#include <functional>
#include <memory>

namespace gauge_adjust::interpolation {

// Spreads values given at source points to a fixed set of target points.
// All spatial preprocessing happens in the constructor; evaluate() is const
// and may be called concurrently.
class Interpolator {
public:
    virtual ~Interpolator() = default;

    virtual VectorXd evaluate(const VectorXd& src_values) const = 0;
    VectorXd operator()(const VectorXd& src_values) const { return evaluate(src_values); }

    virtual int num_sources() const = 0;
    virtual int num_targets() const = 0;

protected:
    void check_source_count(const VectorXd& src_values) const;
};

using InterpolatorFactory =
    std::function<std::unique_ptr<Interpolator>(const Coordinates& src, const Coordinates& trg)>;

// Inverse distance weighting over the `nnear` closest sources
class IdwInterpolator : public Interpolator {
public:
    IdwInterpolator(const Coordinates& src, const Coordinates& trg,
                    int nnear = 4, double power = 2.0);

    VectorXd evaluate(const VectorXd& src_values) const override;
    int num_sources() const override { return num_sources_; }
    int num_targets() const override { return num_targets_; }

private:
    int num_sources_ = 0;
    int num_targets_ = 0;
    IndexMatrix ix_;
    MatrixXd weights_;  // rows sum to one
};

class NearestInterpolator : public Interpolator {
public:
    NearestInterpolator(const Coordinates& src, const Coordinates& trg);

    VectorXd evaluate(const VectorXd& src_values) const override;
    int num_sources() const override { return num_sources_; }
    int num_targets() const override { return static_cast<int>(ix_.size()); }

private:
    int num_sources_ = 0;
    VectorXi ix_;
};

// Radial basis function interpolation, exact at the sources up to the
// ridge term lambda
class RbfInterpolator : public Interpolator {
public:
    RbfInterpolator(const Coordinates& src, const Coordinates& trg,
                    RbfKernel kernel = RbfKernel::MULTIQUADRIC,
                    double mu = 1.0, double lambda = 1.0e-9);

    VectorXd evaluate(const VectorXd& src_values) const override;
    int num_sources() const override { return num_sources_; }
    int num_targets() const override { return static_cast<int>(psi_.rows()); }

private:
    int num_sources_ = 0;
    Eigen::PartialPivLU<MatrixXd> solver_;
    MatrixXd psi_;  // kernel values [n_targets x n_sources]
};

// RBF kernel functions
double rbf_kernel_multiquadric(double d, double mu);
double rbf_kernel_thinplate(double d, double epsilon);
double rbf_kernel_gaussian(double d, double mu);
double rbf_kernel(RbfKernel kernel, double d, double mu);

InterpolatorFactory make_interpolator_factory(const config::InterpolatorConfig& cfg);

} // namespace gauge_adjust::interpolation
