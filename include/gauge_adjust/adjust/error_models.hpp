#pragma once

#include "gauge_adjust/adjust/regression.hpp"
#include "gauge_adjust/core/types.hpp"
#include "gauge_adjust/interpolation/interpolator.hpp"

#include <memory>
#include <optional>
#include <string>

namespace gauge_adjust::adjust {

struct MfbSettings {
    MfbMethod method = MfbMethod::LINREGR;
    double min_slope = 0.1;
    double min_correlation = 0.5;
    double max_p_value = 0.01;
};

// Everything an error model sees for one correction. `obs` and
// `raw_at_obs` cover all observations, `raw` holds the raw values at the
// targets, `ix` the usable observation indices. `ip` maps the `ix` subset
// to the targets and is null for models that do not interpolate.
struct ErrorModelContext {
    const VectorXd& obs;
    const VectorXd& raw;
    const VectorXd& raw_at_obs;
    const IndexSet& ix;
    const interpolation::Interpolator* ip = nullptr;
    int min_gauges = 0;
};

class ErrorModel {
public:
    virtual ~ErrorModel() = default;

    virtual ErrorModelKind kind() const = 0;
    virtual bool needs_interpolator() const { return true; }

    // Corrected values at the targets. Called only with enough usable pairs.
    virtual VectorXd correct(const ErrorModelContext& ctx) const = 0;

    std::string name() const { return error_model_to_string(kind()); }

protected:
    const interpolation::Interpolator& interpolator(const ErrorModelContext& ctx) const;
};

// raw + ip(obs - raw_at_obs), floored at zero
class AdditiveModel : public ErrorModel {
public:
    ErrorModelKind kind() const override { return ErrorModelKind::ADDITIVE; }
    VectorXd correct(const ErrorModelContext& ctx) const override;
};

// raw * ip(obs / raw_at_obs)
class MultiplicativeModel : public ErrorModel {
public:
    ErrorModelKind kind() const override { return ErrorModelKind::MULTIPLICATIVE; }
    VectorXd correct(const ErrorModelContext& ctx) const override;
};

// Additive and multiplicative error at once (Pfaff 2010):
//   eps   = (obs - raw_at_obs) / (raw_at_obs^2 + 1)
//   delta = (obs - eps) / raw_at_obs - 1
//   out   = raw * (1 + ip(delta)) + ip(eps)
class MixedModel : public ErrorModel {
public:
    ErrorModelKind kind() const override { return ErrorModelKind::MIXED; }
    VectorXd correct(const ErrorModelContext& ctx) const override;
};

struct MeanFieldBiasEstimate {
    double corrfact = 1.0;
    int num_ratios = 0;       // finite obs / raw_at_obs ratios
    bool sufficient = false;  // num_ratios >= min_gauges
    bool accepted = false;    // linregr only: regression passed the gates
    std::optional<LinearRegression> regression;
};

// One multiplicative factor for the whole field
class MeanFieldBiasModel : public ErrorModel {
public:
    explicit MeanFieldBiasModel(MfbSettings settings = {});

    ErrorModelKind kind() const override { return ErrorModelKind::MEAN_FIELD_BIAS; }
    bool needs_interpolator() const override { return false; }
    VectorXd correct(const ErrorModelContext& ctx) const override;

    MeanFieldBiasEstimate estimate(const VectorXd& obs, const VectorXd& raw_at_obs,
                                   const IndexSet& ix, int min_gauges) const;

private:
    MfbSettings settings_;
};

// Interpolated gauge values only, the raw field is ignored
class GaugeOnlyModel : public ErrorModel {
public:
    ErrorModelKind kind() const override { return ErrorModelKind::GAUGE_ONLY; }
    VectorXd correct(const ErrorModelContext& ctx) const override;
};

// Returns the raw values; reference for verification runs
class NullModel : public ErrorModel {
public:
    ErrorModelKind kind() const override { return ErrorModelKind::NONE; }
    bool needs_interpolator() const override { return false; }
    VectorXd correct(const ErrorModelContext& ctx) const override { return ctx.raw; }
};

std::unique_ptr<ErrorModel> create_error_model(ErrorModelKind kind, const MfbSettings& mfb = {});

} // namespace gauge_adjust::adjust
