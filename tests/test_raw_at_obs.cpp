#include "gauge_adjust/adjust/raw_at_obs.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using gauge_adjust::Coordinates;
using gauge_adjust::MatrixXd;
using gauge_adjust::NeighborStatistic;
using gauge_adjust::VectorXd;
using gauge_adjust::adjust::RawAtObservations;
using gauge_adjust::adjust::best_match;
using gauge_adjust::adjust::reduce_neighbors;

namespace {

// Ten raw points on the x axis, value = 10 * x
Coordinates raw_line() {
  Coordinates c(10, 2);
  for (int i = 0; i < 10; ++i) {
    c(i, 0) = static_cast<double>(i);
    c(i, 1) = 0.0;
  }
  return c;
}

VectorXd raw_values() {
  VectorXd v(10);
  for (int i = 0; i < 10; ++i) v(i) = 10.0 * i;
  return v;
}

} // namespace

TEST_CASE("reduce_neighbors_mean_and_median") {
  MatrixXd nv(2, 3);
  nv << 1.0, 2.0, 9.0,
        4.0, 4.0, 1.0;

  VectorXd mean = reduce_neighbors(NeighborStatistic::MEAN, nv);
  REQUIRE(mean(0) == Catch::Approx(4.0));
  REQUIRE(mean(1) == Catch::Approx(3.0));

  VectorXd med = reduce_neighbors(NeighborStatistic::MEDIAN, nv);
  REQUIRE(med(0) == Catch::Approx(2.0));
  REQUIRE(med(1) == Catch::Approx(4.0));
}

TEST_CASE("reduce_neighbors_propagates_nan_into_median") {
  MatrixXd nv(1, 3);
  nv << 1.0, std::nan(""), 3.0;
  REQUIRE(std::isnan(reduce_neighbors(NeighborStatistic::MEDIAN, nv)(0)));
  REQUIRE(std::isnan(reduce_neighbors(NeighborStatistic::MEAN, nv)(0)));
}

TEST_CASE("best_match_takes_first_minimum") {
  MatrixXd nv(2, 3);
  nv << 1.0, 4.0, 7.0,
        4.0, 6.0, 5.5;
  VectorXd obs(2);
  obs << 5.0, 5.0;

  VectorXd best = best_match(obs, nv);
  REQUIRE(best(0) == 4.0);
  // 4.0 and 6.0 tie, the first wins; 5.5 is closer still
  REQUIRE(best(1) == 5.5);

  MatrixXd tie(1, 2);
  tie << 4.0, 6.0;
  VectorXd o1(1);
  o1 << 5.0;
  REQUIRE(best_match(o1, tie)(0) == 4.0);
}

TEST_CASE("best_statistic_requires_observations") {
  MatrixXd nv(2, 2);
  nv << 1.0, 2.0,
        3.0, 4.0;
  REQUIRE_THROWS_AS(reduce_neighbors(NeighborStatistic::BEST, nv),
                    gauge_adjust::ShapeMismatch);

  VectorXd short_obs(1);
  short_obs << 1.0;
  REQUIRE_THROWS_AS(reduce_neighbors(NeighborStatistic::BEST, nv, &short_obs),
                    gauge_adjust::ShapeMismatch);
}

TEST_CASE("single_neighbour_is_returned_directly") {
  MatrixXd nv(2, 1);
  nv << 3.0, 7.0;
  VectorXd out = reduce_neighbors(NeighborStatistic::BEST, nv);
  REQUIRE(out(0) == 3.0);
  REQUIRE(out(1) == 7.0);
}

TEST_CASE("raw_at_obs_best_selects_exact_match") {
  Coordinates obs_coords(1, 2);
  obs_coords << 4.1, 0.0;
  VectorXd obs(1);
  obs << 50.0;

  // neighbours of x=4.1 with k=3 are x=4, 5, 3
  RawAtObservations best(obs_coords, raw_line(), 3, NeighborStatistic::BEST);
  REQUIRE(best.neighbor_count() == 3);
  REQUIRE(best.evaluate(raw_values(), &obs)(0) == 50.0);

  RawAtObservations median(obs_coords, raw_line(), 3, NeighborStatistic::MEDIAN);
  REQUIRE(median(raw_values())(0) == Catch::Approx(40.0));

  RawAtObservations mean(obs_coords, raw_line(), 3, NeighborStatistic::MEAN);
  REQUIRE(mean(raw_values())(0) == Catch::Approx(40.0));
}

TEST_CASE("raw_at_obs_k1_is_nearest_raw_value") {
  Coordinates obs_coords(2, 2);
  obs_coords << 6.8, 0.3,
                0.2, -0.1;
  RawAtObservations direct(obs_coords, raw_line(), 1);
  VectorXd out = direct(raw_values());
  REQUIRE(out(0) == 70.0);
  REQUIRE(out(1) == 0.0);
}

TEST_CASE("raw_at_obs_rejects_wrong_raw_length") {
  Coordinates obs_coords(1, 2);
  obs_coords << 1.0, 0.0;
  RawAtObservations rao(obs_coords, raw_line(), 3);
  REQUIRE_THROWS_AS(rao.evaluate(VectorXd::Zero(9)), gauge_adjust::ShapeMismatch);
}
