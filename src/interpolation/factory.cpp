#include "gauge_adjust/interpolation/interpolator.hpp"
#include "gauge_adjust/core/errors.hpp"

namespace gauge_adjust::interpolation {

InterpolatorFactory make_interpolator_factory(const config::InterpolatorConfig& cfg) {
    const InterpolatorMethod method = interpolator_method_from_string(cfg.method);
    const RbfKernel kernel = rbf_kernel_from_string(cfg.rbf_kernel);
    if (cfg.nnear < 1) {
        throw ConfigurationError("interpolator.nnear must be >= 1");
    }

    switch (method) {
        case InterpolatorMethod::IDW: {
            const int nnear = cfg.nnear;
            const double power = cfg.power;
            return [nnear, power](const Coordinates& src, const Coordinates& trg) {
                return std::make_unique<IdwInterpolator>(src, trg, nnear, power);
            };
        }
        case InterpolatorMethod::NEAREST:
            return [](const Coordinates& src, const Coordinates& trg) {
                return std::make_unique<NearestInterpolator>(src, trg);
            };
        case InterpolatorMethod::RBF: {
            const double mu = cfg.rbf_mu;
            const double lambda = cfg.rbf_lambda;
            return [kernel, mu, lambda](const Coordinates& src, const Coordinates& trg) {
                return std::make_unique<RbfInterpolator>(src, trg, kernel, mu, lambda);
            };
        }
    }
    throw ConfigurationError("unsupported interpolator method '" + cfg.method + "'");
}

} // namespace gauge_adjust::interpolation
