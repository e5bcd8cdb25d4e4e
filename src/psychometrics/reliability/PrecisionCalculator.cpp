#include "reliability/PrecisionCalculator.h"
#include "PsychometricExceptions.h"
#include "NormalQuantile.h"
#include "PsychometricStats.h"

#include <algorithm>
#include <cmath>

namespace psychometrics::reliability
{
  PrecisionCalculator::PrecisionCalculator(const config::PrecisionSettings& settings)
    : mSettings(settings)
  {}

  double PrecisionCalculator::computeSEM(double reliability, double populationSD)
  {
    if (!(reliability >= 0.0 && reliability <= 1.0))
      throw InvalidInputException("Reliability must be in [0, 1], got " + std::to_string(reliability));
    if (!(populationSD > 0.0))
      throw InvalidInputException("Population SD must be positive");

    return populationSD * std::sqrt(1.0 - reliability);
  }

  double PrecisionCalculator::computeSEM(double reliability) const
  {
    return computeSEM(reliability, mSettings.populationSD);
  }

  ConfidenceInterval PrecisionCalculator::computeConfidenceInterval(double score,
                                                                    double sem,
                                                                    double confidenceLevel) const
  {
    if (!(confidenceLevel > 0.0 && confidenceLevel < 1.0))
      throw InvalidInputException("Confidence level must be in (0, 1), got " +
                                  std::to_string(confidenceLevel));
    if (!(sem >= 0.0))
      throw InvalidInputException("SEM must be non-negative");

    const double z = stats::twoSidedCriticalValue(confidenceLevel);
    const double lo = static_cast<double>(mSettings.scoreFloor);
    const double hi = static_cast<double>(mSettings.scoreCeiling);

    const double clampedScore = std::clamp(score, lo, hi);
    const double margin = z * sem;

    ConfidenceInterval ci;
    ci.confidenceLevel = confidenceLevel;
    ci.sem = stats::roundTo(sem, 2);

    const int reported = static_cast<int>(std::lround(clampedScore));
    const int lower = static_cast<int>(std::lround(std::clamp(clampedScore - margin, lo, hi)));
    const int upper = static_cast<int>(std::lround(std::clamp(clampedScore + margin, lo, hi)));
    ci.lower = std::min(lower, reported);
    ci.upper = std::max(upper, reported);
    return ci;
  }

  std::optional<ConfidenceInterval>
  PrecisionCalculator::intervalForScore(double score, std::optional<double> reliability) const
  {
    if (!reliability)
      return std::nullopt;
    if (*reliability < mSettings.usabilityFloor || *reliability > 1.0)
      return std::nullopt;

    const double sem = computeSEM(*reliability);
    return computeConfidenceInterval(score, sem, mSettings.confidenceLevel);
  }
} // namespace psychometrics::reliability
