// PsychometricStatsTest.cpp
//
// Unit tests for the correlation, reliability and rounding primitives in
// PsychometricStats.h.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "PsychometricStats.h"

using Catch::Approx;
using namespace psychometrics::stats;

TEST_CASE("computeSampleMoments uses the sample variance", "[PsychometricStats]")
{
  SECTION("Empty input")
  {
    const auto m = computeSampleMoments(std::vector<double>{});
    REQUIRE(m.count == 0);
    REQUIRE(m.mean == 0.0);
    REQUIRE(m.variance == 0.0);
  }

  SECTION("Single observation has no variance")
  {
    const auto m = computeSampleMoments(std::vector<double>{7.0});
    REQUIRE(m.count == 1);
    REQUIRE(m.mean == Approx(7.0));
    REQUIRE(m.variance == 0.0);
  }

  SECTION("Known sample")
  {
    // mean 5, squared deviations sum to 32, n - 1 = 7
    const std::vector<double> values = {2, 4, 4, 4, 5, 5, 7, 9};
    const auto m = computeSampleMoments(values);
    REQUIRE(m.count == 8);
    REQUIRE(m.mean == Approx(5.0));
    REQUIRE(m.variance == Approx(32.0 / 7.0));
    REQUIRE(sampleStandardDeviation(values) == Approx(std::sqrt(32.0 / 7.0)));
  }

  SECTION("Integer containers")
  {
    const std::vector<int> values = {0, 1, 1, 0};
    REQUIRE(sampleVariance(values) == Approx(1.0 / 3.0));
  }
}

TEST_CASE("pearsonCorrelation", "[PsychometricStats]")
{
  SECTION("Perfect positive and negative association")
  {
    const std::vector<double> x = {1, 2, 3, 4, 5};
    const std::vector<double> y = {2, 4, 6, 8, 10};
    const std::vector<double> z = {5, 4, 3, 2, 1};
    REQUIRE(*pearsonCorrelation(x, y) == Approx(1.0));
    REQUIRE(*pearsonCorrelation(x, z) == Approx(-1.0));
  }

  SECTION("Known value")
  {
    const std::vector<double> x = {1, 2, 3, 4, 5};
    const std::vector<double> y = {2, 1, 4, 3, 5};
    REQUIRE(*pearsonCorrelation(x, y) == Approx(0.8));
  }

  SECTION("Zero variance has no correlation")
  {
    const std::vector<double> x = {1, 2, 3};
    const std::vector<double> flat = {4, 4, 4};
    REQUIRE_FALSE(pearsonCorrelation(x, flat).has_value());
    REQUIRE_FALSE(pearsonCorrelation(flat, x).has_value());
  }

  SECTION("Too few or mismatched observations")
  {
    REQUIRE_FALSE(pearsonCorrelation({1.0}, {2.0}).has_value());
    REQUIRE_FALSE(pearsonCorrelation({1.0, 2.0}, {1.0, 2.0, 3.0}).has_value());
  }
}

TEST_CASE("pointBiserialCorrelation", "[PsychometricStats]")
{
  SECTION("Correct answers from the higher scorers give a positive value")
  {
    const std::vector<int> item = {1, 1, 1, 0, 0, 0};
    const std::vector<double> totals = {9, 8, 7, 3, 2, 1};
    const double r = pointBiserialCorrelation(item, totals);
    REQUIRE(r > 0.8);
    REQUIRE(r <= 1.0);
  }

  SECTION("Matches the closed form")
  {
    const std::vector<int> item = {1, 0, 1, 0};
    const std::vector<double> totals = {4, 2, 3, 1};
    // M1 = 3.5, M0 = 1.5, SD = sqrt(5/3), p = q = 0.5
    const double expected = (2.0 / std::sqrt(5.0 / 3.0)) * 0.5;
    REQUIRE(pointBiserialCorrelation(item, totals) == Approx(expected));
  }

  SECTION("Reversed key gives a negative value")
  {
    const std::vector<int> item = {0, 0, 0, 1, 1, 1};
    const std::vector<double> totals = {9, 8, 7, 3, 2, 1};
    REQUIRE(pointBiserialCorrelation(item, totals) < 0.0);
  }

  SECTION("Degenerate inputs collapse to zero")
  {
    REQUIRE(pointBiserialCorrelation({1, 1, 1}, {1, 2, 3}) == 0.0);
    REQUIRE(pointBiserialCorrelation({0, 0, 0}, {1, 2, 3}) == 0.0);
    REQUIRE(pointBiserialCorrelation({1, 0, 1}, {2, 2, 2}) == 0.0);
    REQUIRE(pointBiserialCorrelation({1}, {2}) == 0.0);
    REQUIRE(pointBiserialCorrelation({1, 0}, {2, 3, 4}) == 0.0);
  }
}

TEST_CASE("Spearman-Brown correction", "[PsychometricStats]")
{
  SECTION("Split-half doubling")
  {
    REQUIRE(spearmanBrown(0.60) == Approx(0.75));
    REQUIRE(spearmanBrown(0.71) == Approx(2.0 * 0.71 / 1.71));
    REQUIRE(roundTo(spearmanBrown(0.71), 2) == Approx(0.83));
    REQUIRE(spearmanBrown(0.0) == 0.0);
    REQUIRE(spearmanBrown(1.0) == Approx(1.0));
  }

  SECTION("General prophecy")
  {
    REQUIRE(spearmanBrownProphecy(0.5, 3.0) == Approx(0.75));
    REQUIRE(spearmanBrownProphecy(0.8, 1.0) == Approx(0.8));
    REQUIRE(spearmanBrownProphecy(-1.0, 2.0) == -1.0);
  }

  SECTION("Invalid length factor")
  {
    REQUIRE_THROWS_AS(spearmanBrownProphecy(0.5, 0.0), std::domain_error);
    REQUIRE_THROWS_AS(spearmanBrownProphecy(0.5, -2.0), std::domain_error);
  }
}

TEST_CASE("cronbachsAlpha", "[PsychometricStats]")
{
  SECTION("Known value")
  {
    // k = 4, item variances 1.0 each, total variance 8.0
    REQUIRE(cronbachsAlpha(4, 4.0, 8.0) == Approx((4.0 / 3.0) * 0.5));
  }

  SECTION("Zero total variance gives zero")
  {
    REQUIRE(cronbachsAlpha(5, 0.0, 0.0) == 0.0);
  }

  SECTION("Fewer than two items gives zero")
  {
    REQUIRE(cronbachsAlpha(1, 0.25, 0.25) == 0.0);
  }

  SECTION("Clamped to [-1, 1]")
  {
    REQUIRE(cronbachsAlpha(2, 10.0, 1.0) == -1.0);
  }
}

TEST_CASE("percentileRank", "[PsychometricStats]")
{
  const std::vector<double> reference = {0.1, 0.2, 0.3, 0.4};

  REQUIRE(percentileRank(reference, 0.05) == 0);
  REQUIRE(percentileRank(reference, 0.3) == 50);
  REQUIRE(percentileRank(reference, 0.35) == 75);
  REQUIRE(percentileRank(reference, 1.0) == 100);
  REQUIRE(percentileRank({}, 0.3) == 50);
}

TEST_CASE("roundTo", "[PsychometricStats]")
{
  REQUIRE(roundTo(0.123456, 4) == Approx(0.1235));
  REQUIRE(roundTo(12.345, 1) == Approx(12.3));
  REQUIRE(clampCorrelation(1.2) == 1.0);
  REQUIRE(clampCorrelation(-3.0) == -1.0);
}
