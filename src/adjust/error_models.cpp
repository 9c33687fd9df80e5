#include "gauge_adjust/adjust/error_models.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/core/utils.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

namespace gauge_adjust::adjust {

const interpolation::Interpolator& ErrorModel::interpolator(const ErrorModelContext& ctx) const {
    if (ctx.ip == nullptr) {
        throw InvalidInput(name() + " correction requires an interpolator");
    }
    if (ctx.ip->num_sources() != static_cast<int>(ctx.ix.size())) {
        throw ShapeMismatch(name() + " interpolator built for " +
                            std::to_string(ctx.ip->num_sources()) + " gauges, got " +
                            std::to_string(ctx.ix.size()));
    }
    if (ctx.ip->num_targets() != ctx.raw.size()) {
        throw ShapeMismatch(name() + " interpolator has " +
                            std::to_string(ctx.ip->num_targets()) + " targets, raw has " +
                            std::to_string(ctx.raw.size()) + " values");
    }
    return *ctx.ip;
}

VectorXd AdditiveModel::correct(const ErrorModelContext& ctx) const {
    const auto& ip = interpolator(ctx);
    const VectorXd error = core::select(ctx.obs, ctx.ix) - core::select(ctx.raw_at_obs, ctx.ix);
    VectorXd out = ctx.raw + ip(error);
    // NaN stays NaN
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        if (out[i] < 0.0) out[i] = 0.0;
    }
    return out;
}

VectorXd MultiplicativeModel::correct(const ErrorModelContext& ctx) const {
    const auto& ip = interpolator(ctx);
    const VectorXd ratio = core::select(ctx.obs, ctx.ix).cwiseQuotient(
        core::select(ctx.raw_at_obs, ctx.ix));
    return ctx.raw.cwiseProduct(ip(ratio));
}

VectorXd MixedModel::correct(const ErrorModelContext& ctx) const {
    const auto& ip = interpolator(ctx);
    const VectorXd o = core::select(ctx.obs, ctx.ix);
    const VectorXd r = core::select(ctx.raw_at_obs, ctx.ix);

    const VectorXd eps = ((o - r).array() / (r.array().square() + 1.0)).matrix();
    const VectorXd delta = ((o - eps).array() / r.array() - 1.0).matrix();

    const VectorXd ip_delta = ip(delta);
    const VectorXd ip_eps = ip(eps);
    return (ctx.raw.array() * (1.0 + ip_delta.array()) + ip_eps.array()).matrix();
}

MeanFieldBiasModel::MeanFieldBiasModel(MfbSettings settings) : settings_(settings) {}

MeanFieldBiasEstimate MeanFieldBiasModel::estimate(const VectorXd& obs, const VectorXd& raw_at_obs,
                                                   const IndexSet& ix, int min_gauges) const {
    if (obs.size() != raw_at_obs.size()) {
        throw ShapeMismatch("mfb: obs has " + std::to_string(obs.size()) +
                            " values, raw_at_obs has " + std::to_string(raw_at_obs.size()));
    }

    MeanFieldBiasEstimate est;

    // Unmasked ratios with their gauge / raw pairs
    std::vector<double> ratios;
    std::vector<double> xs;
    std::vector<double> ys;
    ratios.reserve(ix.size());
    for (int i : ix) {
        const double q = obs[i] / raw_at_obs[i];
        if (!std::isfinite(q)) continue;
        ratios.push_back(q);
        xs.push_back(obs[i]);
        ys.push_back(raw_at_obs[i]);
    }
    est.num_ratios = static_cast<int>(ratios.size());
    if (est.num_ratios < min_gauges || ratios.empty()) {
        return est;
    }
    est.sufficient = true;

    switch (settings_.method) {
        case MfbMethod::MEAN: {
            double sum = 0.0;
            for (double q : ratios) sum += q;
            est.corrfact = sum / static_cast<double>(ratios.size());
            break;
        }
        case MfbMethod::MEDIAN:
            est.corrfact = core::median_of(ratios);
            break;
        case MfbMethod::LINREGR: {
            const Eigen::Map<const VectorXd> x(xs.data(), static_cast<Eigen::Index>(xs.size()));
            const Eigen::Map<const VectorXd> y(ys.data(), static_cast<Eigen::Index>(ys.size()));

            // Regress raw on gauge, then invert the through-origin slope
            est.regression = linear_regression(x, y);
            double slope = 0.0;
            double r = 0.0;
            double p = std::numeric_limits<double>::infinity();
            if (est.regression) {
                slope = est.regression->slope;
                r = est.regression->r;
                p = est.regression->p_value;
            }

            est.accepted = slope > settings_.min_slope &&
                           r > settings_.min_correlation &&
                           p < settings_.max_p_value;
            if (!est.accepted) {
                std::cerr << "[MFB] Regression rejected (slope=" << slope << ", r=" << r
                          << ", p=" << p << "), no correction" << std::endl;
                break;
            }

            const std::optional<double> s = slope_through_origin(x, y);
            if (s && *s != 0.0) {
                est.corrfact = 1.0 / *s;
            } else {
                std::cerr << "[MFB] Warning: least-squares slope not usable, no correction"
                          << std::endl;
            }
            break;
        }
    }

    if (!std::isfinite(est.corrfact)) {
        est.corrfact = 1.0;
    }
    return est;
}

VectorXd MeanFieldBiasModel::correct(const ErrorModelContext& ctx) const {
    const MeanFieldBiasEstimate est = estimate(ctx.obs, ctx.raw_at_obs, ctx.ix, ctx.min_gauges);
    if (!est.sufficient) {
        std::cerr << "[MFB] Only " << est.num_ratios << " finite ratios (min "
                  << ctx.min_gauges << "), returning raw" << std::endl;
        return ctx.raw;
    }
    return est.corrfact * ctx.raw;
}

VectorXd GaugeOnlyModel::correct(const ErrorModelContext& ctx) const {
    const auto& ip = interpolator(ctx);
    return ip(core::select(ctx.obs, ctx.ix));
}

std::unique_ptr<ErrorModel> create_error_model(ErrorModelKind kind, const MfbSettings& mfb) {
    switch (kind) {
        case ErrorModelKind::ADDITIVE: return std::make_unique<AdditiveModel>();
        case ErrorModelKind::MULTIPLICATIVE: return std::make_unique<MultiplicativeModel>();
        case ErrorModelKind::MIXED: return std::make_unique<MixedModel>();
        case ErrorModelKind::MEAN_FIELD_BIAS: return std::make_unique<MeanFieldBiasModel>(mfb);
        case ErrorModelKind::GAUGE_ONLY: return std::make_unique<GaugeOnlyModel>();
        case ErrorModelKind::NONE: return std::make_unique<NullModel>();
    }
    throw ConfigurationError("unsupported adjustment method");
}

} // namespace gauge_adjust::adjust
