#include "gauge_adjust/adjust/regression.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace gauge_adjust::adjust {

namespace {

constexpr double kTiny = 1.0e-20;

} // namespace

std::optional<LinearRegression> linear_regression(const VectorXd& x, const VectorXd& y) {
    if (x.size() != y.size()) {
        throw ShapeMismatch("regression needs equally long x and y");
    }
    const Eigen::Index n = x.size();
    if (n < 2) return std::nullopt;

    const double mx = x.mean();
    const double my = y.mean();
    double sxx = 0.0, syy = 0.0, sxy = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double dx = x(i) - mx;
        const double dy = y(i) - my;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (!(std::isfinite(sxx) && std::isfinite(syy) && std::isfinite(sxy))) {
        return std::nullopt;
    }
    if (sxx == 0.0) return std::nullopt;

    LinearRegression out;
    out.n = static_cast<int>(n);
    out.slope = sxy / sxx;
    out.intercept = my - out.slope * mx;

    const double r_den = std::sqrt(sxx * syy);
    out.r = (r_den == 0.0) ? 0.0 : std::clamp(sxy / r_den, -1.0, 1.0);

    if (n == 2) {
        // a line through two points is exact; a flat one carries no evidence
        out.p_value = (y(0) == y(1)) ? 1.0 : 0.0;
        out.std_err = 0.0;
        return out;
    }

    const double df = static_cast<double>(n - 2);
    const double t = out.r * std::sqrt(df / ((1.0 - out.r + kTiny) * (1.0 + out.r + kTiny)));
    if (std::isfinite(t)) {
        boost::math::students_t dist(df);
        out.p_value = 2.0 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
    } else {
        out.p_value = 0.0;
    }
    out.std_err = std::sqrt(std::max(0.0, (1.0 - out.r * out.r) * syy / sxx / df));
    return out;
}

std::optional<double> slope_through_origin(const VectorXd& x, const VectorXd& y) {
    if (x.size() != y.size()) {
        throw ShapeMismatch("regression needs equally long x and y");
    }
    if (x.size() == 0) return std::nullopt;

    const double sxx = x.squaredNorm();
    if (!(sxx > 0.0) || !std::isfinite(sxx)) return std::nullopt;

    const double s = x.dot(y) / sxx;
    if (!std::isfinite(s)) return std::nullopt;
    return s;
}

} // namespace gauge_adjust::adjust
