#pragma once

#include "gauge_adjust/core/types.hpp"

#include <optional>

namespace gauge_adjust::adjust {

// Ordinary least-squares line y = slope * x + intercept
struct LinearRegression {
    double slope = 0.0;
    double intercept = 0.0;
    double r = 0.0;        // Pearson correlation
    double p_value = 1.0;  // two-sided, H0: slope == 0 (Student-t, n-2 dof)
    double std_err = 0.0;  // standard error of the slope
    int n = 0;
};

// std::nullopt when fewer than two points or all x identical
std::optional<LinearRegression> linear_regression(const VectorXd& x, const VectorXd& y);

// Least-squares slope of y = s * x (no intercept). std::nullopt when the
// system is singular or the result is not finite.
std::optional<double> slope_through_origin(const VectorXd& x, const VectorXd& y);

} // namespace gauge_adjust::adjust
