#include "gauge_adjust/config/configuration.hpp"
#include "gauge_adjust/core/errors.hpp"
#include "gauge_adjust/interpolation/interpolator.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using gauge_adjust::Coordinates;
using gauge_adjust::RbfKernel;
using gauge_adjust::VectorXd;
using namespace gauge_adjust::interpolation;

namespace {

Coordinates scattered_sources() {
  Coordinates src(5, 2);
  src << 0.0, 0.0,
         4.0, 0.5,
         1.5, 3.0,
         3.5, 3.5,
         2.0, 1.5;
  return src;
}

VectorXd source_values() {
  VectorXd v(5);
  v << 1.0, 3.0, -2.0, 5.0, 0.5;
  return v;
}

} // namespace

TEST_CASE("idw_is_exact_at_source_locations") {
  const Coordinates src = scattered_sources();
  IdwInterpolator ip(src, src, 4, 2.0);
  REQUIRE(ip.num_sources() == 5);
  REQUIRE(ip.num_targets() == 5);

  VectorXd out = ip(source_values());
  for (int i = 0; i < 5; ++i) {
    REQUIRE(out(i) == Catch::Approx(source_values()(i)));
  }
}

TEST_CASE("idw_weights_equidistant_sources_equally") {
  Coordinates src(2, 2);
  src << 0.0, 0.0,
         2.0, 0.0;
  Coordinates trg(1, 2);
  trg << 1.0, 0.0;
  VectorXd v(2);
  v << 1.0, 3.0;

  IdwInterpolator ip(src, trg, 2, 2.0);
  REQUIRE(ip(v)(0) == Catch::Approx(2.0));

  // closer source dominates with inverse square weights: 1/1 vs 1/9
  trg << 0.5, 0.0;
  IdwInterpolator near(src, trg, 2, 2.0);
  REQUIRE(near(v)(0) == Catch::Approx((1.0 / 0.25 * 1.0 + 1.0 / 2.25 * 3.0) /
                                      (1.0 / 0.25 + 1.0 / 2.25)));
}

TEST_CASE("idw_with_one_neighbour_is_nearest") {
  Coordinates trg(2, 2);
  trg << 3.9, 0.6,
         1.4, 2.7;
  IdwInterpolator idw(scattered_sources(), trg, 1);
  NearestInterpolator nn(scattered_sources(), trg);

  VectorXd a = idw(source_values());
  VectorXd b = nn(source_values());
  REQUIRE(a(0) == 3.0);
  REQUIRE(a(1) == -2.0);
  REQUIRE(b(0) == 3.0);
  REQUIRE(b(1) == -2.0);
}

TEST_CASE("interpolators_without_sources_return_nan") {
  Coordinates trg(2, 2);
  trg << 0.0, 0.0,
         1.0, 1.0;
  IdwInterpolator idw(Coordinates(0, 2), trg);
  NearestInterpolator nn(Coordinates(0, 2), trg);
  RbfInterpolator rbf(Coordinates(0, 2), trg);

  for (const VectorXd& out : {idw(VectorXd(0)), nn(VectorXd(0)), rbf(VectorXd(0))}) {
    REQUIRE(out.size() == 2);
    REQUIRE(std::isnan(out(0)));
    REQUIRE(std::isnan(out(1)));
  }
}

TEST_CASE("rbf_reproduces_source_values") {
  const Coordinates src = scattered_sources();
  for (RbfKernel k : {RbfKernel::MULTIQUADRIC, RbfKernel::GAUSSIAN, RbfKernel::THINPLATE}) {
    RbfInterpolator ip(src, src, k, 1.0, 1.0e-9);
    VectorXd out = ip(source_values());
    for (int i = 0; i < 5; ++i) {
      REQUIRE(out(i) == Catch::Approx(source_values()(i)).margin(1e-5));
    }
  }
}

TEST_CASE("rbf_kernels_basic_values") {
  REQUIRE(rbf_kernel_multiquadric(0.0, 2.0) == Catch::Approx(2.0));
  REQUIRE(rbf_kernel_multiquadric(3.0, 4.0) == Catch::Approx(5.0));
  REQUIRE(rbf_kernel_gaussian(0.0, 1.0) == Catch::Approx(1.0));
  REQUIRE(rbf_kernel_thinplate(0.0, 1.0e-12) == 0.0);
  REQUIRE(rbf_kernel_thinplate(2.0, 0.0) == Catch::Approx(4.0 * std::log(2.0)));
}

TEST_CASE("interpolators_reject_wrong_value_count") {
  IdwInterpolator ip(scattered_sources(), scattered_sources());
  REQUIRE_THROWS_AS(ip(VectorXd::Zero(4)), gauge_adjust::ShapeMismatch);

  NearestInterpolator nn(scattered_sources(), scattered_sources());
  REQUIRE_THROWS_AS(nn(VectorXd::Zero(6)), gauge_adjust::ShapeMismatch);
}

TEST_CASE("interpolator_factory_follows_config") {
  gauge_adjust::config::InterpolatorConfig cfg;

  cfg.method = "nearest";
  auto make = make_interpolator_factory(cfg);
  auto ip = make(scattered_sources(), scattered_sources());
  REQUIRE(dynamic_cast<NearestInterpolator*>(ip.get()) != nullptr);

  cfg.method = "RBF";
  ip = make_interpolator_factory(cfg)(scattered_sources(), scattered_sources());
  REQUIRE(dynamic_cast<RbfInterpolator*>(ip.get()) != nullptr);

  cfg.method = "kriging";
  REQUIRE_THROWS_AS(make_interpolator_factory(cfg), gauge_adjust::ConfigurationError);

  cfg.method = "idw";
  cfg.rbf_kernel = "cubic";
  REQUIRE_THROWS_AS(make_interpolator_factory(cfg), gauge_adjust::ConfigurationError);
}
