#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include "reliability/PrecisionCalculator.h"
#include "adaptive/ScoreConversion.h"
#include "PsychometricExceptions.h"

using Catch::Approx;
using namespace psychometrics;
using psychometrics::reliability::PrecisionCalculator;

TEST_CASE("PrecisionCalculator::computeSEM", "[PrecisionCalculator]")
{
  PrecisionCalculator calc;

  SECTION("Known values")
  {
    REQUIRE(calc.computeSEM(0.0) == Approx(15.0));
    REQUIRE(calc.computeSEM(1.0) == Approx(0.0));
    REQUIRE(calc.computeSEM(0.91) == Approx(4.5));
    REQUIRE(PrecisionCalculator::computeSEM(0.75, 10.0) == Approx(5.0));
  }

  SECTION("Never exceeds the population SD and falls as reliability rises")
  {
    double previous = calc.computeSEM(0.0);
    for (int step = 1; step <= 20; ++step)
    {
      const double sem = calc.computeSEM(step / 20.0);
      REQUIRE(sem >= 0.0);
      REQUIRE(sem <= 15.0);
      REQUIRE(sem <= previous);
      previous = sem;
    }
  }

  SECTION("Reliability outside [0, 1] is rejected")
  {
    REQUIRE_THROWS_AS(calc.computeSEM(-0.01), InvalidInputException);
    REQUIRE_THROWS_AS(calc.computeSEM(1.01), InvalidInputException);
    REQUIRE_THROWS_AS(calc.computeSEM(std::nan("")), InvalidInputException);
    REQUIRE_THROWS_AS(PrecisionCalculator::computeSEM(0.5, 0.0), InvalidInputException);
  }
}

TEST_CASE("PrecisionCalculator::computeConfidenceInterval", "[PrecisionCalculator]")
{
  PrecisionCalculator calc;

  SECTION("95% interval around a mid-range score")
  {
    const ConfidenceInterval ci = calc.computeConfidenceInterval(100.0, 4.5, 0.95);
    // 1.96 * 4.5 = 8.82
    REQUIRE(ci.lower == 91);
    REQUIRE(ci.upper == 109);
    REQUIRE(ci.confidenceLevel == Approx(0.95));
    REQUIRE(ci.sem == Approx(4.5));
  }

  SECTION("90% interval uses the table critical value")
  {
    const ConfidenceInterval ci = calc.computeConfidenceInterval(100.0, 10.0, 0.90);
    REQUIRE(ci.lower == 84);
    REQUIRE(ci.upper == 116);
  }

  SECTION("Bounds are clamped into the score range")
  {
    const ConfidenceInterval high = calc.computeConfidenceInterval(158.0, 6.0, 0.95);
    REQUIRE(high.upper == 160);
    REQUIRE(high.lower <= 158);

    const ConfidenceInterval low = calc.computeConfidenceInterval(30.0, 5.0, 0.95);
    REQUIRE(low.lower == 40);
    REQUIRE(low.upper == 50);
  }

  SECTION("The reported score always lies inside the interval")
  {
    for (double score : {40.0, 41.4, 99.5, 100.0, 137.2, 160.0})
    {
      for (double sem : {0.0, 0.4, 3.3, 12.0})
      {
        const ConfidenceInterval ci = calc.computeConfidenceInterval(score, sem, 0.95);
        const int reported = static_cast<int>(std::lround(score));
        REQUIRE(ci.lower <= reported);
        REQUIRE(reported <= ci.upper);
        REQUIRE(ci.lower >= 40);
        REQUIRE(ci.upper <= 160);
      }
    }
  }

  SECTION("SEM is rounded to two decimals")
  {
    REQUIRE(calc.computeConfidenceInterval(100.0, 4.4721, 0.95).sem == Approx(4.47));
  }

  SECTION("Invalid arguments")
  {
    REQUIRE_THROWS_AS(calc.computeConfidenceInterval(100.0, 4.0, 0.0), InvalidInputException);
    REQUIRE_THROWS_AS(calc.computeConfidenceInterval(100.0, 4.0, 1.0), InvalidInputException);
    REQUIRE_THROWS_AS(calc.computeConfidenceInterval(100.0, 4.0, 95.0), InvalidInputException);
    REQUIRE_THROWS_AS(calc.computeConfidenceInterval(100.0, -1.0, 0.95), InvalidInputException);
  }
}

TEST_CASE("PrecisionCalculator::intervalForScore", "[PrecisionCalculator]")
{
  PrecisionCalculator calc;

  SECTION("No reliability means no interval")
  {
    REQUIRE_FALSE(calc.intervalForScore(100.0, std::nullopt).has_value());
  }

  SECTION("Reliability below the usability floor means no interval")
  {
    REQUIRE_FALSE(calc.intervalForScore(100.0, 0.59).has_value());
  }

  SECTION("Usable reliability")
  {
    auto ci = calc.intervalForScore(100.0, 0.60);
    REQUIRE(ci.has_value());
    REQUIRE(ci->lower < 100);
    REQUIRE(ci->upper > 100);

    auto exact = calc.intervalForScore(112.0, 1.0);
    REQUIRE(exact.has_value());
    REQUIRE(exact->lower == 112);
    REQUIRE(exact->upper == 112);
  }

  SECTION("Configured level and range are honoured")
  {
    config::PrecisionSettings settings;
    settings.confidenceLevel = 0.99;
    settings.scoreFloor = 55;
    settings.scoreCeiling = 145;
    PrecisionCalculator narrow(settings);

    auto ci = narrow.intervalForScore(60.0, 0.75);
    REQUIRE(ci.has_value());
    REQUIRE(ci->confidenceLevel == Approx(0.99));
    REQUIRE(ci->lower == 55);
  }
}

TEST_CASE("Theta to score conversion", "[ScoreConversion]")
{
  config::PrecisionSettings settings;

  REQUIRE(adaptive::thetaToScore(0.0, settings) == 100);
  REQUIRE(adaptive::thetaToScore(1.0, settings) == 115);
  REQUIRE(adaptive::thetaToScore(-2.0, settings) == 70);
  REQUIRE(adaptive::thetaToScore(5.0, settings) == 160);
  REQUIRE(adaptive::thetaToScore(-5.0, settings) == 40);

  REQUIRE(adaptive::thetaToPercentile(0.0) == Approx(50.0));
  REQUIRE(adaptive::thetaToPercentile(1.0) == Approx(84.1));
  REQUIRE(adaptive::thetaToPercentile(-1.0) == Approx(15.9));
}
