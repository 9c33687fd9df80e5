#include "gauge_adjust/adjust/validity.hpp"
#include "gauge_adjust/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using gauge_adjust::IndexSet;
using gauge_adjust::VectorXd;
using namespace gauge_adjust::adjust;

TEST_CASE("valid_indices_drops_nonfinite_sentinels_and_low_values") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  VectorXd v(7);
  v << 1.0, nan, -9999.0, 0.0, inf, -0.5, -99.0;

  IndexSet ix = valid_indices(v, 0.0, {-9999.0, -99.0});
  REQUIRE(ix == (IndexSet{0, 3}));

  // without sentinels and with a very low floor the sentinels count
  IndexSet loose = valid_indices(v, -1.0e6, {});
  REQUIRE(loose == (IndexSet{0, 2, 3, 5, 6}));
}

TEST_CASE("valid_indices_min_value_is_inclusive") {
  VectorXd v(3);
  v << 0.1, 0.2, 0.3;
  REQUIRE(valid_indices(v, 0.2) == (IndexSet{1, 2}));
}

TEST_CASE("valid_pairs_intersects_both_sides") {
  VectorXd obs(5);
  obs << 1.0, -1.0, 2.0, 3.0, 4.0;
  VectorXd raw(5);
  raw << 1.0, 1.0, std::numeric_limits<double>::quiet_NaN(), 3.0, -9999.0;

  REQUIRE(valid_pairs(obs, raw, 0.0, {-9999.0}) == (IndexSet{0, 3}));
}

TEST_CASE("valid_pairs_rejects_length_mismatch") {
  REQUIRE_THROWS_AS(valid_pairs(VectorXd::Ones(3), VectorXd::Ones(4), 0.0),
                    gauge_adjust::ShapeMismatch);
}

TEST_CASE("index_set_operations") {
  IndexSet a{0, 2, 3, 5};
  IndexSet b{2, 5, 7};
  REQUIRE(intersect(a, b) == (IndexSet{2, 5}));
  REQUIRE(set_difference(a, b) == (IndexSet{0, 3}));
  REQUIRE(set_difference(a, IndexSet{3}) == (IndexSet{0, 2, 5}));
}
